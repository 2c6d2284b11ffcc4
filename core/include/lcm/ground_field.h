#pragma once

#include "lcm/world.h"

#include <cstdint>
#include <vector>

namespace lcm {

struct GroundPlane {
  Vec3 normal{0.0f, 1.0f, 0.0f};
  float distance = 0.0f; // dot(normal, p) == distance on the plane
  bool bounded = false;  // restrict hits to [min, max] in XZ
  float min_x = 0.0f;
  float max_x = 0.0f;
  float min_z = 0.0f;
  float max_z = 0.0f;
  uint32_t layer = 1;
};

struct GroundBox {
  Vec3 center{0.0f, 0.0f, 0.0f};
  Vec3 half_extents{0.5f, 0.5f, 0.5f};
  uint32_t layer = 1;
};

// Static collision world made of planes and boxes.
class GroundField : public GroundQueryProvider {
 public:
  void add_plane(const GroundPlane& plane);
  void add_box(const GroundBox& box);
  void add_flat(float height, uint32_t layer = 1);
  // Inclined plane rising along +Z by `rise_deg`, passing through (.., base_height, z0),
  // bounded to the given XZ rectangle.
  void add_ramp(float min_x, float max_x, float z0, float z1, float base_height, float rise_deg,
                uint32_t layer = 1);
  void add_stairs(float min_x, float max_x, float z0, float step_depth, float step_rise, int steps,
                  uint32_t layer = 1);
  void clear();

  GroundHit cast_down(const Vec3& from, const Vec3& to, uint32_t collision_mask) const override;

  const std::vector<GroundPlane>& planes() const { return planes_; }
  const std::vector<GroundBox>& boxes() const { return boxes_; }
  size_t query_count() const { return query_count_; }

 private:
  std::vector<GroundPlane> planes_;
  std::vector<GroundBox> boxes_;
  mutable size_t query_count_ = 0;
};

struct BodyKeyframe {
  float time = 0.0f;
  Vec3 velocity{0.0f, 0.0f, 0.0f};
  float yaw = 0.0f;
};

// Scripted body: follows velocity/yaw keyframes (step-held) and snaps onto
// the ground below it.
class KinematicBody : public PhysicsBodyState {
 public:
  KinematicBody(const GroundQueryProvider* ground, const Vec3& start, uint32_t collision_mask = 1);

  void set_keyframes(std::vector<BodyKeyframe> keys);
  void set_velocity(const Vec3& velocity);
  void set_yaw(float yaw);
  void step(float dt);

  BodyState body_state() const override { return state_; }
  float time() const { return time_; }

 private:
  void snap_to_ground();

  const GroundQueryProvider* ground_ = nullptr;
  uint32_t collision_mask_ = 1;
  std::vector<BodyKeyframe> keys_;
  BodyState state_;
  float yaw_ = 0.0f;
  float time_ = 0.0f;
  float probe_up_ = 0.6f;
  float probe_down_ = 2.0f;
};

} // namespace lcm
