#pragma once

#include "lcm/world.h"

namespace lcm {

struct CenterOfGravityConfig {
  Vec3 base_offset{0.0f, 1.0f, 0.0f}; // body-local rest position
  float speed_threshold = 4.0f;       // speed at which the offset saturates
  float forward_offset = 0.15f;
  float backward_offset = 0.08f;
  float lateral_offset = 0.1f;
  float lateral_dead_zone = 0.1f;
  float movement_threshold = 0.1f;
  float stabilization_strength = 1.0f;
  float max_stabilization_distance = 0.3f;
};

// Velocity-driven torso centre of mass. The offset is applied directly each
// update (no smoothing).
class CenterOfGravity {
 public:
  explicit CenterOfGravity(const CenterOfGravityConfig& config);

  void update(const BodyState& body);

  // External displacement in world space (pushes, animation), added on top of
  // the velocity offset until cleared.
  void set_external_offset(const Vec3& world_offset) { external_offset_ = world_offset; }
  void clear_external_offset() { external_offset_ = {0.0f, 0.0f, 0.0f}; }

  const Vec3& local_offset() const { return local_offset_; }
  Vec3 world_position() const;
  Vec3 neutral_world_position() const;
  // Horizontal drift from neutral, scaled and clamped; biases idle stance.
  Vec3 stabilization_offset() const;

  const CenterOfGravityConfig& config() const { return config_; }

  void draw_debug(DebugDrawSink& sink) const;

 private:
  CenterOfGravityConfig config_;
  BodyState body_;
  Vec3 local_offset_{0.0f, 0.0f, 0.0f};
  Vec3 external_offset_{0.0f, 0.0f, 0.0f};
};

} // namespace lcm
