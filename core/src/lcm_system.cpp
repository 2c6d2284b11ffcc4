#include "lcm/lcm_system.h"

#include "lcm/log.h"
#include "lcm/movement_log.h"

#include <sstream>

namespace lcm {

LcmSystem::LcmSystem(const LcmConfig& config, const PhysicsBodyState* body,
                     const GroundQueryProvider* ground)
    : config_(config),
      body_(body),
      ground_(ground),
      terrain_(config.terrain, ground),
      cog_(config.center_of_gravity),
      stepping_(config.stepping, config.gait, &terrain_, &cog_),
      foot_ik_(config.foot_ik),
      stability_(config.stability, ground) {}

bool LcmSystem::initialize() {
  init_attempted_ = true;
  enabled_ = false;
  if (!body_) {
    log::error("LcmSystem: physics body missing; locomotion disabled");
    return false;
  }
  if (!ground_) {
    log::error("LcmSystem: ground query provider missing; locomotion disabled");
    return false;
  }
  last_body_ = body_->body_state();
  terrain_.update_terrain_analysis(last_body_);
  cog_.update(last_body_);
  if (!stepping_.initialize(last_body_)) {
    log::error("LcmSystem: goal stepping failed to initialize; locomotion disabled");
    return false;
  }
  enabled_ = true;
  log::info("LcmSystem: ready");
  return true;
}

void LcmSystem::publish_step_events() {
  // Landings first: the opposite foot may lift in the same frame.
  for (const auto& s : stepping_.landed_steps()) {
    events_.emit(StepLanded{s.side, s.position, s.step_count, frame_});
  }
  for (const auto& s : stepping_.started_steps()) {
    events_.emit(StepStarted{s.side, s.position, frame_});
  }
}

void LcmSystem::update(float dt) {
  if (!init_attempted_) initialize();
  if (!enabled_) return;

  last_body_ = body_->body_state();

  terrain_.update_terrain_analysis(last_body_);
  cog_.update(last_body_);
  stepping_.set_stability_hint(zone_);
  stepping_.update(last_body_, dt);
  publish_step_events();
  foot_ik_.apply(stepping_, last_body_, dt);

  const Vec3 left = foot_ik_.effector(FootSide::Left).position;
  const Vec3 right = foot_ik_.effector(FootSide::Right).position;
  const StabilityZone previous = zone_;
  zone_ = stability_.update(left, right, last_body_.basis.forward, cog_.world_position());
  if (zone_ != previous) {
    events_.emit(StabilityChanged{previous, zone_, frame_});
    log::debug(std::string("LcmSystem: stability ") + stability_zone_name(previous) + " -> " +
               stability_zone_name(zone_));
  }

  if (movement_log::enabled()) {
    std::ostringstream line;
    line.setf(std::ios::fixed);
    line.precision(4);
    const auto& gait = stepping_.gait();
    line << "frame=" << frame_ << " speed=" << gait.speed << " zone=" << stability_zone_name(zone_)
         << " trend=" << forward_trend_name(terrain_.analysis().forward_trend)
         << " left=" << stepping_.foot(FootSide::Left).progress
         << " right=" << stepping_.foot(FootSide::Right).progress;
    movement_log::write(line.str());
  }

  if (debug_sink_ && config_.debug_draw) {
    draw_debug();
  }
  ++frame_;
}

void LcmSystem::draw_debug() {
  terrain_.draw_debug(*debug_sink_);
  cog_.draw_debug(*debug_sink_);
  stepping_.draw_debug(*debug_sink_);
  stability_.draw_debug(*debug_sink_);
}

} // namespace lcm
