#include "lcm/foot_ik.h"

#include <algorithm>
#include <cmath>

namespace lcm {

FootIkBridge::FootIkBridge(const FootIkConfig& config) : config_(config) {}

const FootEffector& FootIkBridge::effector(FootSide side) const {
  return side == FootSide::Left ? left_ : right_;
}

void FootIkBridge::solve_leg(FootEffector& e, FootSide side, const BodyState& body) const {
  const float lateral = side == FootSide::Left ? -config_.hip_half_width : config_.hip_half_width;
  e.hip = vec3_add(body.position, basis_to_world(body.basis, {lateral, config_.hip_height, 0.0f}));
  const Vec3 pole = vec3_add(vec3_add(e.hip, vec3_mul(body.basis.forward, config_.knee_pole_distance)),
                             vec3_mul(body.basis.up, -config_.thigh_length));
  const TwoBoneResult r =
      solve_two_bone(e.hip, config_.thigh_length, config_.shin_length, e.position, pole, &e.bend);
  e.knee = r.knee;
  e.ankle = r.ankle;
  e.reached = r.reached;
}

void FootIkBridge::apply(const GoalStepping& stepping, const BodyState& body, float dt) {
  const bool engage = config_.enabled && body.on_ground && stepping.enabled() && stepping.initialized();
  const float rate = engage ? config_.blend_in_rate : config_.blend_out_rate;
  const float alpha = (rate > 0.0f) ? (1.0f - std::exp(-std::max(dt, 0.0f) * rate)) : 1.0f;
  const float goal = engage ? 1.0f : 0.0f;

  for (FootSide side : {FootSide::Left, FootSide::Right}) {
    FootEffector& e = side == FootSide::Left ? left_ : right_;
    if (stepping.initialized()) {
      const FootStepState& f = stepping.foot(side);
      e.position = f.target;
      e.orientation = f.orientation;
      if (config_.solve_legs) solve_leg(e, side, body);
    }
    e.influence = saturate(e.influence + (goal - e.influence) * alpha);
  }
}

Vec3 FootIkBridge::blend(const Vec3& animated, FootSide side) const {
  const FootEffector& e = effector(side);
  return vec3_lerp(animated, e.position, e.influence);
}

TwoBoneResult solve_two_bone(const Vec3& hip, float upper, float lower, const Vec3& target,
                             const Vec3& pole, Vec3* prev_bend) {
  TwoBoneResult out;
  upper = std::max(upper, kEps);
  lower = std::max(lower, kEps);
  const float span_min = std::fabs(upper - lower);
  const float span_max = upper + lower;

  const Vec3 reach = vec3_sub(target, hip);
  const float dist = vec3_length(reach);
  out.reached = dist >= span_min && dist <= span_max;
  const Vec3 aim = dist > kEps ? vec3_mul(reach, 1.0f / dist) : Vec3{0.0f, -1.0f, 0.0f};
  const float d = clampf(dist, span_min + 0.001f, std::max(span_min + 0.001f, span_max - 0.001f));

  // Bend axis: the pole direction with its component along the aim removed.
  Vec3 to_pole = vec3_sub(pole, hip);
  Vec3 bend = vec3_sub(to_pole, vec3_mul(aim, vec3_dot(to_pole, aim)));
  if (vec3_length_sq(bend) < kEps * kEps && prev_bend) {
    bend = vec3_sub(*prev_bend, vec3_mul(aim, vec3_dot(*prev_bend, aim)));
  }
  if (vec3_length_sq(bend) < kEps * kEps) {
    bend = vec3_cross(aim, Vec3{1.0f, 0.0f, 0.0f});
    if (vec3_length_sq(bend) < kEps * kEps) bend = vec3_cross(aim, Vec3{0.0f, 0.0f, 1.0f});
  }
  bend = vec3_normalize(bend);

  if (prev_bend) {
    out.continuity = vec3_dot(*prev_bend, bend);
    if (out.continuity < 0.0f) {
      bend = vec3_mul(bend, -1.0f);
      out.continuity = -out.continuity;
    }
    *prev_bend = bend;
  }

  // Law of cosines at the hip.
  const float cos_hip = clampf((upper * upper + d * d - lower * lower) / (2.0f * upper * d), -1.0f, 1.0f);
  const float sin_hip = std::sqrt(std::max(0.0f, 1.0f - cos_hip * cos_hip));
  out.knee = vec3_add(hip, vec3_add(vec3_mul(aim, upper * cos_hip), vec3_mul(bend, upper * sin_hip)));
  out.ankle = vec3_add(hip, vec3_mul(aim, d));
  return out;
}

} // namespace lcm
