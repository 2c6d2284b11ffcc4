#pragma once

#include "lcm/center_of_gravity.h"
#include "lcm/config.h"
#include "lcm/event_bus.h"
#include "lcm/foot_ik.h"
#include "lcm/goal_stepping.h"
#include "lcm/stability_evaluator.h"
#include "lcm/terrain_detector.h"
#include "lcm/world.h"

#include <cstdint>
#include <memory>

namespace lcm {

// Runs the locomotion core for one character. Per frame: terrain analysis,
// centre of gravity, goal stepping (fed the previous stability zone), IK
// bridge, then stability on the IK effector positions.
class LcmSystem {
 public:
  LcmSystem(const LcmConfig& config, const PhysicsBodyState* body, const GroundQueryProvider* ground);

  // Returns false when a collaborator is missing; the system then stays
  // disabled and update() leaves every output untouched.
  bool initialize();
  void update(float dt);

  void set_debug_sink(DebugDrawSink* sink) { debug_sink_ = sink; }
  void set_external_cog_offset(const Vec3& offset) { cog_.set_external_offset(offset); }

  bool enabled() const { return enabled_; }
  uint64_t frame() const { return frame_; }
  const BodyState& last_body() const { return last_body_; }

  const TerrainDetector& terrain() const { return terrain_; }
  const CenterOfGravity& center_of_gravity() const { return cog_; }
  const GoalStepping& stepping() const { return stepping_; }
  const FootIkBridge& foot_ik() const { return foot_ik_; }
  const StabilityEvaluator& stability() const { return stability_; }
  StabilityZone zone() const { return zone_; }

  EventBus& events() { return events_; }
  const LcmConfig& config() const { return config_; }

 private:
  void publish_step_events();
  void draw_debug();

  LcmConfig config_;
  const PhysicsBodyState* body_ = nullptr;
  const GroundQueryProvider* ground_ = nullptr;
  DebugDrawSink* debug_sink_ = nullptr;

  TerrainDetector terrain_;
  CenterOfGravity cog_;
  GoalStepping stepping_;
  FootIkBridge foot_ik_;
  StabilityEvaluator stability_;
  EventBus events_;

  BodyState last_body_;
  StabilityZone zone_ = StabilityZone::Stable;
  bool enabled_ = false;
  bool init_attempted_ = false;
  uint64_t frame_ = 0;
};

} // namespace lcm
