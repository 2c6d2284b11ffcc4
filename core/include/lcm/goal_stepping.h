#pragma once

#include "lcm/center_of_gravity.h"
#include "lcm/gait.h"
#include "lcm/stability_evaluator.h"
#include "lcm/terrain_detector.h"
#include "lcm/world.h"

#include <cstdint>
#include <vector>

namespace lcm {

enum class FootSide : uint8_t {
  Left = 0,
  Right = 1
};

enum class FootPhase : uint8_t {
  Planted = 0,
  Stepping = 1
};

const char* foot_side_name(FootSide side);
FootSide opposite(FootSide side);

struct FootStepState {
  Vec3 ideal_position{0.0f, 0.0f, 0.0f};
  Vec3 target{0.0f, 0.0f, 0.0f};
  Basis orientation;
  Vec3 ground_normal{0.0f, 1.0f, 0.0f};
  FootPhase phase = FootPhase::Planted;
  float progress = 1.0f;
  Vec3 step_start{0.0f, 0.0f, 0.0f};
  float stance_timer = 0.0f;
  float arc_height = 0.0f;
  uint32_t step_count = 0;

  bool stepping() const { return phase == FootPhase::Stepping; }
};

struct GoalSteppingConfig {
  float max_speed_reference = 4.0f;
  float movement_threshold = 0.1f;
  float input_smoothing_tau = 0.1f;
  float foot_height_offset = 0.0f;
  bool idle_stabilization = true;
  float idle_stabilization_delay = 0.5f;
  float idle_stabilization_influence = 1.0f;
  float max_idle_stabilization = 0.15f;
  float slope_min_deg = 5.0f;
  float slope_height_multiplier = 1.5f;
  bool align_to_terrain = true;
  bool use_stability_trigger = false;
  float stability_trigger_scale = 0.5f;
};

struct StepEventInfo {
  FootSide side = FootSide::Left;
  Vec3 position{0.0f, 0.0f, 0.0f};
  uint32_t step_count = 0;
};

// Goal-directed stepping: each foot re-targets its continuously recomputed
// ideal position during the swing instead of a position fixed at lift-off.
class GoalStepping {
 public:
  GoalStepping(const GoalSteppingConfig& config, const GaitCurveSet& curves,
               const TerrainDetector* terrain, const CenterOfGravity* cog);

  // Validates collaborators and plants both feet. Returns false and disables
  // the component on a configuration error.
  bool initialize(const BodyState& body);
  void update(const BodyState& body, float dt);

  void set_stability_hint(StabilityZone zone) { stability_hint_ = zone; }

  bool enabled() const { return enabled_; }
  bool initialized() const { return initialized_; }
  bool moving() const { return moving_; }
  float idle_time() const { return idle_time_; }
  const GaitState& gait() const { return gait_; }
  const FootStepState& foot(FootSide side) const;
  bool both_planted() const;
  const Vec3& move_direction() const { return move_dir_; }
  const GoalSteppingConfig& config() const { return config_; }
  const GaitCurveSet& curves() const { return curves_; }

  // Per-frame events; cleared at the start of each update.
  const std::vector<StepEventInfo>& started_steps() const { return started_; }
  const std::vector<StepEventInfo>& landed_steps() const { return landed_; }

  // Arc height for a swing toward `ideal`, raised when climbing.
  float slope_adjusted_height(const Vec3& start, const Vec3& ideal, const Vec3& ground_normal) const;

  void draw_debug(DebugDrawSink& sink) const;

 private:
  FootStepState& foot_mut(FootSide side);
  void compute_ideal_positions(const BodyState& body);
  void project_to_terrain(FootStepState& foot) const;
  void advance_step(FootSide side, float dt);
  void try_trigger();
  void update_orientation(FootStepState& foot) const;

  GoalSteppingConfig config_;
  GaitCurveSet curves_;
  const TerrainDetector* terrain_ = nullptr;
  const CenterOfGravity* cog_ = nullptr;
  bool enabled_ = true;
  bool initialized_ = false;
  FootStepState left_;
  FootStepState right_;
  GaitState gait_;
  Vec3 move_dir_{0.0f, 0.0f, 1.0f};
  Vec3 facing_{0.0f, 0.0f, 1.0f};
  bool moving_ = false;
  float idle_time_ = 0.0f;
  StabilityZone stability_hint_ = StabilityZone::Stable;
  std::vector<StepEventInfo> started_;
  std::vector<StepEventInfo> landed_;
};

} // namespace lcm
