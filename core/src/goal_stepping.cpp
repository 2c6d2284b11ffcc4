#include "lcm/goal_stepping.h"

#include "lcm/log.h"
#include "lcm/movement_log.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace lcm {

const char* foot_side_name(FootSide side) {
  return side == FootSide::Left ? "left" : "right";
}

FootSide opposite(FootSide side) {
  return side == FootSide::Left ? FootSide::Right : FootSide::Left;
}

GoalStepping::GoalStepping(const GoalSteppingConfig& config, const GaitCurveSet& curves,
                           const TerrainDetector* terrain, const CenterOfGravity* cog)
    : config_(config), curves_(curves), terrain_(terrain), cog_(cog) {}

const FootStepState& GoalStepping::foot(FootSide side) const {
  return side == FootSide::Left ? left_ : right_;
}

FootStepState& GoalStepping::foot_mut(FootSide side) {
  return side == FootSide::Left ? left_ : right_;
}

bool GoalStepping::both_planted() const {
  return !left_.stepping() && !right_.stepping();
}

bool GoalStepping::initialize(const BodyState& body) {
  if (!enabled_) return false;
  if (!terrain_ || !terrain_->configured()) {
    log::error("GoalStepping: terrain detector missing or unconfigured; stepping disabled");
    enabled_ = false;
    return false;
  }
  if (!cog_) {
    log::error("GoalStepping: center of gravity missing; stepping disabled");
    enabled_ = false;
    return false;
  }

  gait_ = sample_gait(curves_, 0.0f, config_.max_speed_reference);
  facing_ = vec3_normalize(vec3_horizontal(body.basis.forward));
  if (vec3_length_sq(facing_) < 0.5f) facing_ = {0.0f, 0.0f, 1.0f};
  move_dir_ = facing_;
  moving_ = false;
  idle_time_ = 0.0f;
  compute_ideal_positions(body);
  for (FootStepState* f : {&left_, &right_}) {
    f->target = f->ideal_position;
    f->step_start = f->target;
    f->phase = FootPhase::Planted;
    f->progress = 1.0f;
    f->stance_timer = gait_.min_stance_duration;
    f->arc_height = 0.0f;
    update_orientation(*f);
  }
  initialized_ = true;
  log::info("GoalStepping: initialized");
  return true;
}

void GoalStepping::project_to_terrain(FootStepState& foot) const {
  const TerrainSample s = terrain_->sample_at(foot.ideal_position);
  foot.ideal_position.y = s.ground_height + config_.foot_height_offset;
  foot.ground_normal = s.normal;
}

void GoalStepping::compute_ideal_positions(const BodyState& body) {
  const Vec3 c = body.position;
  const float half_width = 0.5f * gait_.stance_width;

  if (moving_) {
    const Vec3 side = vec3_normalize(vec3_cross(up_axis(), move_dir_));
    const float half_step = 0.5f * gait_.step_length;
    const Vec3 left_base = vec3_sub(c, vec3_mul(side, half_width));
    const Vec3 right_base = vec3_add(c, vec3_mul(side, half_width));
    const Vec3 reach = vec3_mul(move_dir_, half_step);
    const Vec3 lf = vec3_add(left_base, reach);
    const Vec3 lb = vec3_sub(left_base, reach);
    const Vec3 rf = vec3_add(right_base, reach);
    const Vec3 rb = vec3_sub(right_base, reach);

    // Assignment A: left forward / right back. B: left back / right forward.
    bool use_a = true;
    if (left_.stepping()) {
      use_a = true;
    } else if (right_.stepping()) {
      use_a = false;
    } else {
      const float cost_a = vec3_distance(vec3_horizontal(left_.target), vec3_horizontal(lf)) +
                           vec3_distance(vec3_horizontal(right_.target), vec3_horizontal(rb));
      const float cost_b = vec3_distance(vec3_horizontal(left_.target), vec3_horizontal(lb)) +
                           vec3_distance(vec3_horizontal(right_.target), vec3_horizontal(rf));
      use_a = cost_a <= cost_b;
    }
    left_.ideal_position = use_a ? lf : lb;
    right_.ideal_position = use_a ? rb : rf;
  } else {
    Vec3 side = vec3_normalize(vec3_horizontal(body.basis.right));
    if (vec3_length_sq(side) < 0.5f) side = {1.0f, 0.0f, 0.0f};
    left_.ideal_position = vec3_sub(c, vec3_mul(side, half_width));
    right_.ideal_position = vec3_add(c, vec3_mul(side, half_width));

    if (config_.idle_stabilization && idle_time_ > config_.idle_stabilization_delay) {
      Vec3 stab = vec3_mul(cog_->stabilization_offset(), config_.idle_stabilization_influence);
      stab = vec3_clamp_length(vec3_horizontal(stab), config_.max_idle_stabilization);
      left_.ideal_position = vec3_add(left_.ideal_position, stab);
      right_.ideal_position = vec3_add(right_.ideal_position, stab);
    }
  }

  left_.ideal_position.y = c.y;
  right_.ideal_position.y = c.y;
  project_to_terrain(left_);
  project_to_terrain(right_);
}

float GoalStepping::slope_adjusted_height(const Vec3& start, const Vec3& ideal,
                                          const Vec3& ground_normal) const {
  const float base = gait_.step_height;
  const float slope_deg = angle_between_deg(ground_normal, up_axis());
  if (slope_deg <= config_.slope_min_deg) return base;

  Vec3 travel = vec3_normalize(vec3_horizontal(vec3_sub(ideal, start)));
  if (vec3_length_sq(travel) < 0.5f) {
    if (!moving_) return base;
    travel = move_dir_;
  }
  const Vec3 uphill = vec3_normalize(vec3_horizontal(vec3_mul(ground_normal, -1.0f)));
  if (vec3_length_sq(uphill) < 0.5f) return base;
  const float alignment = vec3_dot(uphill, travel);
  if (alignment <= 0.0f) return base;
  const float steepness = slope_deg / 90.0f;
  return base * (1.0f + steepness * alignment * config_.slope_height_multiplier);
}

void GoalStepping::advance_step(FootSide side, float dt) {
  FootStepState& f = foot_mut(side);
  if (!f.stepping()) return;

  const float duration = std::max(gait_.step_duration, kEps);
  f.progress = std::min(1.0f, f.progress + dt / duration);
  if (f.progress >= 1.0f) {
    f.progress = 1.0f;
    f.target = f.ideal_position;
    f.phase = FootPhase::Planted;
    f.stance_timer = 0.0f;
    f.arc_height = 0.0f;
    ++f.step_count;
    landed_.push_back({side, f.target, f.step_count});
    if (movement_log::enabled()) {
      std::ostringstream line;
      line.setf(std::ios::fixed);
      line.precision(4);
      line << "step_landed foot=" << foot_side_name(side) << " n=" << f.step_count << " pos=("
           << f.target.x << "," << f.target.y << "," << f.target.z << ")";
      movement_log::write(line.str());
    }
    return;
  }

  f.arc_height = slope_adjusted_height(f.step_start, f.ideal_position, f.ground_normal);
  const float p = f.progress;
  Vec3 pos = vec3_lerp(f.step_start, f.ideal_position, p);
  pos.y = f.step_start.y + (f.ideal_position.y - f.step_start.y) * p + f.arc_height * std::sin(p * kPi);
  f.target = pos;
}

void GoalStepping::try_trigger() {
  const bool stability_boost = config_.use_stability_trigger &&
                               static_cast<int>(stability_hint_) >=
                                   static_cast<int>(StabilityZone::Unstable);
  const float trigger = gait_.trigger_distance * (stability_boost ? config_.stability_trigger_scale : 1.0f);

  FootSide order[2] = {FootSide::Left, FootSide::Right};
  const float drift_l = vec3_distance(left_.target, left_.ideal_position);
  const float drift_r = vec3_distance(right_.target, right_.ideal_position);
  if (drift_r > drift_l) {
    order[0] = FootSide::Right;
    order[1] = FootSide::Left;
  }

  for (FootSide side : order) {
    FootStepState& f = foot_mut(side);
    const FootStepState& other = foot(opposite(side));
    if (f.stepping() || other.stepping()) continue;
    if (f.stance_timer < gait_.min_stance_duration) continue;
    const float drift = vec3_distance(f.target, f.ideal_position);
    if (drift <= trigger) continue;

    f.phase = FootPhase::Stepping;
    f.progress = 0.0f;
    f.step_start = f.target;
    f.arc_height = slope_adjusted_height(f.step_start, f.ideal_position, f.ground_normal);
    started_.push_back({side, f.step_start, f.step_count});
    if (movement_log::enabled()) {
      std::ostringstream line;
      line.setf(std::ios::fixed);
      line.precision(4);
      line << "step_started foot=" << foot_side_name(side) << " drift=" << drift
           << " trigger=" << trigger << " stance=" << f.stance_timer
           << (stability_boost ? " stability_boost" : "");
      movement_log::write(line.str());
    }
    break;
  }
}

void GoalStepping::update_orientation(FootStepState& foot) const {
  const Vec3 forward = moving_ ? move_dir_ : facing_;
  const Vec3 up = config_.align_to_terrain ? foot.ground_normal : up_axis();
  foot.orientation = basis_from_up_forward(up, forward);
}

void GoalStepping::update(const BodyState& body, float dt) {
  if (!enabled_) return;
  if (!initialized_ && !initialize(body)) return;

  started_.clear();
  landed_.clear();

  const Vec3 planar = vec3_horizontal(body.velocity);
  const float speed = vec3_length(planar);
  gait_ = sample_gait(curves_, speed, config_.max_speed_reference);

  const Vec3 facing = vec3_normalize(vec3_horizontal(body.basis.forward));
  if (vec3_length_sq(facing) > 0.5f) facing_ = facing;

  moving_ = speed > config_.movement_threshold;
  if (moving_) {
    idle_time_ = 0.0f;
    const Vec3 desired = vec3_mul(planar, 1.0f / speed);
    const float tau = config_.input_smoothing_tau;
    const float alpha = (tau > 0.0f) ? (1.0f - std::exp(-dt / tau)) : 1.0f;
    // Turn by heading angle so an exact reversal still rotates.
    const float heading = std::atan2(move_dir_.x, move_dir_.z);
    float delta = std::atan2(desired.x, desired.z) - heading;
    while (delta > kPi) delta -= 2.0f * kPi;
    while (delta < -kPi) delta += 2.0f * kPi;
    const float next = heading + delta * alpha;
    move_dir_ = {std::sin(next), 0.0f, std::cos(next)};
  } else {
    idle_time_ += dt;
  }

  compute_ideal_positions(body);

  if (!left_.stepping()) left_.stance_timer += dt;
  if (!right_.stepping()) right_.stance_timer += dt;

  advance_step(FootSide::Left, dt);
  advance_step(FootSide::Right, dt);
  try_trigger();

  update_orientation(left_);
  update_orientation(right_);
}

void GoalStepping::draw_debug(DebugDrawSink& sink) const {
  const Vec3 ideal_color{0.3f, 0.3f, 1.0f};
  for (FootSide side : {FootSide::Left, FootSide::Right}) {
    const FootStepState& f = foot(side);
    const Vec3 color = f.stepping() ? Vec3{1.0f, 0.6f, 0.0f} : Vec3{0.0f, 0.9f, 0.4f};
    sink.point(f.ideal_position, 0.03f, ideal_color);
    sink.point(f.target, 0.05f, color);
    sink.line(f.target, f.ideal_position, ideal_color);
    sink.line(f.target, vec3_add(f.target, vec3_mul(f.orientation.forward, 0.15f)), color);
  }
}

} // namespace lcm
