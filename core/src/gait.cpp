#include "lcm/gait.h"

#include "lcm/math.h"

#include <algorithm>

namespace lcm {

namespace {
constexpr float kMinFrequency = 0.05f;
} // namespace

GaitCurveSet default_gait_curves() {
  GaitCurveSet curves;
  curves.step_length = ResponseCurve({{0.0f, 0.2f}, {0.5f, 0.4f}, {1.0f, 0.8f}});
  curves.step_frequency = ResponseCurve({{0.0f, 1.5f}, {0.5f, 1.9f}, {1.0f, 2.5f}});
  curves.stance_width = ResponseCurve({{0.0f, 0.25f}, {1.0f, 0.18f}});
  curves.stance_ratio = ResponseCurve({{0.0f, 0.6f}, {1.0f, 0.35f}});
  curves.step_height = ResponseCurve({{0.0f, 0.08f}, {0.5f, 0.12f}, {1.0f, 0.2f}});
  curves.trigger_distance = ResponseCurve({{0.0f, 0.08f}, {1.0f, 0.25f}});
  return curves;
}

float gait_speed_ratio(float speed, float max_speed_reference) {
  if (max_speed_reference <= kEps) return 0.0f;
  return saturate(speed / max_speed_reference);
}

GaitState sample_gait(const GaitCurveSet& curves, float speed, float max_speed_reference) {
  GaitState out;
  out.speed = speed;
  out.speed_ratio = gait_speed_ratio(speed, max_speed_reference);
  const float r = out.speed_ratio;
  out.step_length = std::max(0.0f, curves.step_length.sample(r));
  out.step_frequency = std::max(kMinFrequency, curves.step_frequency.sample(r));
  out.step_duration = 1.0f / out.step_frequency;
  out.stance_width = std::max(0.0f, curves.stance_width.sample(r));
  out.stance_ratio = saturate(curves.stance_ratio.sample(r));
  out.step_height = std::max(0.0f, curves.step_height.sample(r));
  out.trigger_distance = std::max(0.0f, curves.trigger_distance.sample(r));
  out.min_stance_duration = out.step_duration * out.stance_ratio;
  return out;
}

} // namespace lcm
