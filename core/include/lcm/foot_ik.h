#pragma once

#include "lcm/goal_stepping.h"
#include "lcm/math.h"
#include "lcm/world.h"

namespace lcm {

struct FootIkConfig {
  bool enabled = true;
  float blend_in_rate = 10.0f;
  float blend_out_rate = 6.0f;
  // Leg chain used to place the knees. Hips sit at (+-hip_half_width,
  // hip_height, 0) in the body frame; knees bend toward a point
  // knee_pole_distance ahead of the hip.
  bool solve_legs = true;
  float hip_half_width = 0.1f;
  float hip_height = 0.9f;
  float thigh_length = 0.45f;
  float shin_length = 0.45f;
  float knee_pole_distance = 0.5f;
};

struct FootEffector {
  Vec3 position{0.0f, 0.0f, 0.0f};
  Basis orientation;
  float influence = 0.0f;
  Vec3 hip{0.0f, 0.0f, 0.0f};
  Vec3 knee{0.0f, 0.0f, 0.0f};
  Vec3 ankle{0.0f, 0.0f, 0.0f};
  bool reached = false;
  Vec3 bend{0.0f, 0.0f, 0.0f};
};

// Carries stepping targets onto the leg IK effectors.
class FootIkBridge {
 public:
  explicit FootIkBridge(const FootIkConfig& config = {});

  void set_enabled(bool enabled) { config_.enabled = enabled; }
  bool enabled() const { return config_.enabled; }

  void apply(const GoalStepping& stepping, const BodyState& body, float dt);

  const FootEffector& effector(FootSide side) const;
  // Animated foot position pulled toward the effector by its influence.
  Vec3 blend(const Vec3& animated, FootSide side) const;

  const FootIkConfig& config() const { return config_; }

 private:
  void solve_leg(FootEffector& e, FootSide side, const BodyState& body) const;

  FootIkConfig config_;
  FootEffector left_;
  FootEffector right_;
};

struct TwoBoneResult {
  Vec3 knee{0.0f, 0.0f, 0.0f};
  Vec3 ankle{0.0f, 0.0f, 0.0f};
  bool reached = false;
  // Dot of this frame's bend direction with the previous one.
  float continuity = 1.0f;
};

// Knee and ankle for a chain of `upper` and `lower` bone lengths rooted at
// `hip`, reaching for `target`. The knee bends toward `pole`. When `prev_bend`
// is given the bend never flips against it, and it receives the new bend.
TwoBoneResult solve_two_bone(const Vec3& hip, float upper, float lower, const Vec3& target,
                             const Vec3& pole, Vec3* prev_bend = nullptr);

} // namespace lcm
