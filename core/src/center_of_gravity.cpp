#include "lcm/center_of_gravity.h"

#include <algorithm>
#include <cmath>

namespace lcm {

CenterOfGravity::CenterOfGravity(const CenterOfGravityConfig& config) : config_(config) {}

void CenterOfGravity::update(const BodyState& body) {
  body_ = body;
  const Vec3 planar = vec3_horizontal(body.velocity);
  if (vec3_length(planar) <= config_.movement_threshold) {
    local_offset_ = {0.0f, 0.0f, 0.0f};
    return;
  }

  const float threshold = std::max(config_.speed_threshold, kEps);
  const float local_forward = vec3_dot(planar, vec3_horizontal(body.basis.forward));
  const float local_right = vec3_dot(planar, vec3_horizontal(body.basis.right));

  Vec3 offset{0.0f, 0.0f, 0.0f};
  const float fwd_scale = std::min(std::abs(local_forward), threshold) / threshold;
  if (local_forward > 0.0f) {
    offset.z = config_.forward_offset * fwd_scale;
  } else if (local_forward < 0.0f) {
    offset.z = -config_.backward_offset * fwd_scale;
  }
  if (std::abs(local_right) > config_.lateral_dead_zone) {
    const float lat_scale = std::min(std::abs(local_right), threshold) / threshold;
    offset.x = (local_right > 0.0f ? 1.0f : -1.0f) * config_.lateral_offset * lat_scale;
  }
  local_offset_ = offset;
}

Vec3 CenterOfGravity::world_position() const {
  const Vec3 local = vec3_add(config_.base_offset, local_offset_);
  return vec3_add(vec3_add(body_.position, basis_to_world(body_.basis, local)), external_offset_);
}

Vec3 CenterOfGravity::neutral_world_position() const {
  return vec3_add(body_.position, basis_to_world(body_.basis, config_.base_offset));
}

Vec3 CenterOfGravity::stabilization_offset() const {
  const Vec3 deviation = vec3_horizontal(vec3_sub(world_position(), neutral_world_position()));
  const Vec3 scaled = vec3_mul(deviation, config_.stabilization_strength);
  return vec3_clamp_length(scaled, config_.max_stabilization_distance);
}

void CenterOfGravity::draw_debug(DebugDrawSink& sink) const {
  const Vec3 cog = world_position();
  const Vec3 ground{cog.x, body_.position.y, cog.z};
  sink.point(cog, 0.05f, {1.0f, 0.4f, 0.0f});
  sink.line(cog, ground, {1.0f, 0.4f, 0.0f});
}

} // namespace lcm
