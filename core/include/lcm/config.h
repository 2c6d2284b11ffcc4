#pragma once

#include "lcm/center_of_gravity.h"
#include "lcm/foot_ik.h"
#include "lcm/gait.h"
#include "lcm/goal_stepping.h"
#include "lcm/log.h"
#include "lcm/stability_evaluator.h"
#include "lcm/terrain_detector.h"

#include <filesystem>
#include <string>

namespace lcm {

struct LcmConfig {
  TerrainDetectorConfig terrain;
  CenterOfGravityConfig center_of_gravity;
  GoalSteppingConfig stepping;
  GaitCurveSet gait = default_gait_curves();
  StabilityEvaluatorConfig stability;
  FootIkConfig foot_ik;
  log::Level log_level = log::Level::Info;
  bool debug_draw = false;
};

// Reads a YAML (.yaml/.yml) or JSON (.json) file. A missing file or an
// unknown extension leaves `out` at its defaults and logs a warning. Parse
// and type errors return false with a message in `error`.
bool load_lcm_config(const std::filesystem::path& path, LcmConfig& out, std::string& error);

// Convenience wrapper; logs parse errors and falls back to defaults.
LcmConfig load_lcm_config(const std::filesystem::path& path);

} // namespace lcm
