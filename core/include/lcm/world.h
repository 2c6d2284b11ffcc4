#pragma once

#include "lcm/math.h"

#include <cstdint>

namespace lcm {

struct BodyState {
  Vec3 position{0.0f, 0.0f, 0.0f};
  Basis basis;
  Vec3 velocity{0.0f, 0.0f, 0.0f};
  bool on_ground = true;
  Vec3 floor_normal{0.0f, 1.0f, 0.0f};
};

class PhysicsBodyState {
 public:
  virtual ~PhysicsBodyState() = default;
  virtual BodyState body_state() const = 0;
};

struct GroundHit {
  bool hit = false;
  Vec3 position{0.0f, 0.0f, 0.0f};
  Vec3 normal{0.0f, 1.0f, 0.0f};
};

// Synchronous ground probe along the segment from -> to.
class GroundQueryProvider {
 public:
  virtual ~GroundQueryProvider() = default;
  virtual GroundHit cast_down(const Vec3& from, const Vec3& to, uint32_t collision_mask) const = 0;
};

class DebugDrawSink {
 public:
  virtual ~DebugDrawSink() = default;
  virtual void line(const Vec3& a, const Vec3& b, const Vec3& color) = 0;
  virtual void point(const Vec3& p, float size, const Vec3& color) = 0;
};

} // namespace lcm
