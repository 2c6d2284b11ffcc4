#pragma once

#include "lcm/curve.h"

namespace lcm {

// Speed-indexed gait parameters; each curve maps speed ratio [0,1] to a value.
struct GaitCurveSet {
  ResponseCurve step_length;
  ResponseCurve step_frequency;
  ResponseCurve stance_width;
  ResponseCurve stance_ratio;
  ResponseCurve step_height;
  ResponseCurve trigger_distance;
};

struct GaitState {
  float speed = 0.0f;
  float speed_ratio = 0.0f;
  float step_length = 0.0f;
  float step_frequency = 0.0f;
  float step_duration = 0.0f;
  float stance_width = 0.0f;
  float stance_ratio = 0.0f;
  float step_height = 0.0f;
  float trigger_distance = 0.0f;
  float min_stance_duration = 0.0f;
};

GaitCurveSet default_gait_curves();
float gait_speed_ratio(float speed, float max_speed_reference);
GaitState sample_gait(const GaitCurveSet& curves, float speed, float max_speed_reference);

} // namespace lcm
