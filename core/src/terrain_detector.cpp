#include "lcm/terrain_detector.h"

#include "lcm/log.h"
#include "lcm/movement_log.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace lcm {

namespace {

Vec3 category_color(SampleCategory category) {
  switch (category) {
    case SampleCategory::Near: return {0.2f, 0.9f, 0.2f};
    case SampleCategory::Far: return {0.2f, 0.5f, 1.0f};
    case SampleCategory::Forward: return {1.0f, 0.8f, 0.1f};
    case SampleCategory::Path: return {0.9f, 0.3f, 0.9f};
    case SampleCategory::Query: return {1.0f, 1.0f, 1.0f};
  }
  return {1.0f, 1.0f, 1.0f};
}

} // namespace

const char* sample_category_name(SampleCategory category) {
  switch (category) {
    case SampleCategory::Near: return "near";
    case SampleCategory::Far: return "far";
    case SampleCategory::Forward: return "forward";
    case SampleCategory::Query: return "query";
    case SampleCategory::Path: return "path";
  }
  return "query";
}

const char* forward_trend_name(ForwardTrend trend) {
  switch (trend) {
    case ForwardTrend::Stationary: return "stationary";
    case ForwardTrend::Flat: return "flat";
    case ForwardTrend::Ascending: return "ascending";
    case ForwardTrend::Descending: return "descending";
  }
  return "stationary";
}

const char* side_trend_name(SideTrend trend) {
  switch (trend) {
    case SideTrend::Level: return "level";
    case SideTrend::LeftHigh: return "left_high";
    case SideTrend::RightHigh: return "right_high";
  }
  return "level";
}

bool parse_empty_analysis_policy(const std::string& name, EmptyAnalysisPolicy& out) {
  if (name == "retain" || name == "retain_previous") {
    out = EmptyAnalysisPolicy::RetainPrevious;
    return true;
  }
  if (name == "reset") {
    out = EmptyAnalysisPolicy::Reset;
    return true;
  }
  return false;
}

TerrainDetector::TerrainDetector(const TerrainDetectorConfig& config,
                                 const GroundQueryProvider* ground)
    : config_(config), ground_(ground) {
  config_.near_samples = std::max(0, config_.near_samples);
  config_.far_samples = std::max(0, config_.far_samples);
  config_.forward_bias_samples = std::max(0, config_.forward_bias_samples);
}

TerrainSample TerrainDetector::sample_at(const Vec3& world_pos, SampleCategory category) const {
  TerrainSample sample;
  sample.position = world_pos;
  sample.category = category;
  sample.ground_height = world_pos.y;
  sample.normal = up_axis();
  if (!ground_) return sample;

  const Vec3 from = vec3_add(world_pos, vec3_mul(up_axis(), config_.ray_start_height));
  const Vec3 to = vec3_sub(world_pos, vec3_mul(up_axis(), config_.ray_length));
  const GroundHit hit = ground_->cast_down(from, to, config_.collision_mask);
  if (!hit.hit) return sample;

  sample.has_ground = true;
  sample.ground_height = hit.position.y;
  const Vec3 n = vec3_normalize(hit.normal);
  sample.normal = (vec3_length_sq(n) > 0.5f) ? n : up_axis();
  sample.slope_deg = angle_between_deg(sample.normal, up_axis());
  return sample;
}

std::vector<TerrainSample> TerrainDetector::sample_path(const Vec3& from, const Vec3& to,
                                                        int count) const {
  std::vector<TerrainSample> out;
  if (count < 2) {
    out.push_back(sample_at(from, SampleCategory::Path));
    return out;
  }
  out.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    const float t = static_cast<float>(i) / static_cast<float>(count - 1);
    out.push_back(sample_at(vec3_lerp(from, to, t), SampleCategory::Path));
  }
  return out;
}

float TerrainDetector::ground_height_at(const Vec3& world_pos) const {
  return sample_at(world_pos).ground_height;
}

Vec3 TerrainDetector::ground_normal_at(const Vec3& world_pos) const {
  return sample_at(world_pos).normal;
}

void TerrainDetector::collect_ring(const Vec3& center, float radius, int count,
                                   SampleCategory category) {
  for (int i = 0; i < count; ++i) {
    const float angle = 2.0f * kPi * static_cast<float>(i) / static_cast<float>(count);
    const Vec3 p{center.x + std::cos(angle) * radius, center.y, center.z + std::sin(angle) * radius};
    samples_.push_back(sample_at(p, category));
  }
}

void TerrainDetector::collect_forward(const Vec3& center, const Vec3& move_dir) {
  const int n = config_.forward_bias_samples;
  for (int i = 0; i < n; ++i) {
    const float t = static_cast<float>(i + 1) / static_cast<float>(n);
    const float r = config_.near_radius + (config_.far_radius - config_.near_radius) * t;
    samples_.push_back(sample_at(vec3_add(center, vec3_mul(move_dir, r)), SampleCategory::Forward));
  }
}

const TerrainAnalysis& TerrainDetector::update_terrain_analysis(const BodyState& body) {
  if (!ground_) {
    if (!reported_unconfigured_) {
      log::error("TerrainDetector: no ground query provider; terrain analysis disabled");
      reported_unconfigured_ = true;
    }
    return analysis_;
  }

  samples_.clear();
  const Vec3 center = body.position;
  const Vec3 planar_vel = vec3_horizontal(body.velocity);
  const float speed = vec3_length(planar_vel);
  const bool moving = speed > config_.movement_threshold;
  const Vec3 move_dir = moving ? vec3_mul(planar_vel, 1.0f / speed) : Vec3{0.0f, 0.0f, 0.0f};

  collect_ring(center, config_.near_radius, config_.near_samples, SampleCategory::Near);
  collect_ring(center, config_.far_radius, config_.far_samples, SampleCategory::Far);
  if (moving) {
    collect_forward(center, move_dir);
  }

  std::vector<const TerrainSample*> valid;
  valid.reserve(samples_.size());
  for (const auto& s : samples_) {
    if (s.has_ground) valid.push_back(&s);
  }

  if (valid.empty()) {
    if (!all_missed_) {
      log::warn("TerrainDetector: all probes missed ground");
      all_missed_ = true;
    }
    if (config_.empty_policy == EmptyAnalysisPolicy::Reset) {
      const uint64_t pass = analysis_.pass + 1;
      previous_ = analysis_;
      analysis_ = TerrainAnalysis{};
      analysis_.pass = pass;
      analysis_.sample_count = samples_.size();
    } else {
      analysis_.stale = true;
      analysis_.hit_count = 0;
      analysis_.sample_count = samples_.size();
      ++analysis_.pass;
    }
    return analysis_;
  }
  if (all_missed_) {
    log::info("TerrainDetector: ground reacquired");
    all_missed_ = false;
  }

  TerrainAnalysis next;
  next.valid = true;
  next.stale = false;
  next.pass = analysis_.pass + 1;
  next.sample_count = samples_.size();
  next.hit_count = valid.size();

  float sum = 0.0f;
  for (const auto* s : valid) {
    sum += s->ground_height;
    next.max_slope_deg = std::max(next.max_slope_deg, s->slope_deg);
  }
  next.average_height = sum / static_cast<float>(valid.size());
  float var = 0.0f;
  for (const auto* s : valid) {
    const float d = s->ground_height - next.average_height;
    var += d * d;
  }
  next.height_variance = var / static_cast<float>(valid.size());
  next.roughness = std::sqrt(next.height_variance);

  if (!moving) {
    next.forward_trend = ForwardTrend::Stationary;
  } else {
    // Near ring mean against the far ring restricted to the forward half-plane
    // of travel plus the forward probes. The whole far ring averages out a
    // uniform slope.
    float near_sum = 0.0f;
    int near_n = 0;
    float far_sum = 0.0f;
    int far_n = 0;
    for (const auto* s : valid) {
      if (s->category == SampleCategory::Near) {
        near_sum += s->ground_height;
        ++near_n;
      } else if (s->category == SampleCategory::Forward) {
        far_sum += s->ground_height;
        ++far_n;
      } else if (s->category == SampleCategory::Far) {
        const Vec3 rel = vec3_horizontal(vec3_sub(s->position, center));
        if (vec3_dot(rel, move_dir) > 0.0f) {
          far_sum += s->ground_height;
          ++far_n;
        }
      }
    }
    if (near_n > 0 && far_n > 0) {
      next.forward_height_delta = far_sum / static_cast<float>(far_n) - near_sum / static_cast<float>(near_n);
      if (next.forward_height_delta > config_.trend_threshold) {
        next.forward_trend = ForwardTrend::Ascending;
      } else if (next.forward_height_delta < -config_.trend_threshold) {
        next.forward_trend = ForwardTrend::Descending;
      } else {
        next.forward_trend = ForwardTrend::Flat;
      }
    } else {
      next.forward_trend = ForwardTrend::Flat;
    }
  }

  const Vec3 right = vec3_normalize(vec3_horizontal(body.basis.right));
  const TerrainSample left_probe =
      sample_at(vec3_sub(center, vec3_mul(right, config_.side_probe_offset)));
  const TerrainSample right_probe =
      sample_at(vec3_add(center, vec3_mul(right, config_.side_probe_offset)));
  const float side_delta = right_probe.ground_height - left_probe.ground_height;
  next.side_slope_deg = rad_to_deg(std::atan2(std::abs(side_delta), 1.0f));
  if (side_delta > config_.side_level_threshold) {
    next.side_trend = SideTrend::RightHigh;
  } else if (side_delta < -config_.side_level_threshold) {
    next.side_trend = SideTrend::LeftHigh;
  } else {
    next.side_trend = SideTrend::Level;
  }

  const float steep = std::max(config_.steep_slope_threshold, kEps);
  const float far_r = std::max(config_.far_radius, kEps);
  for (const auto* s : valid) {
    if (std::abs(s->ground_height - center.y) > config_.step_height_threshold) continue;
    if (s->slope_deg > config_.steep_slope_threshold) continue;
    const float dist = vec3_length(vec3_horizontal(vec3_sub(s->position, center)));
    SteppableZone zone;
    zone.position = {s->position.x, s->ground_height, s->position.z};
    zone.height = s->ground_height;
    zone.slope_deg = s->slope_deg;
    zone.quality = saturate(1.0f - 0.5f * (s->slope_deg / steep) - 0.5f * (dist / far_r));
    next.steppable_zones.push_back(zone);
  }

  previous_ = std::move(analysis_);
  analysis_ = std::move(next);
  log_changes();
  return analysis_;
}

void TerrainDetector::log_changes() const {
  if (!previous_.valid) return;
  const bool trend_changed = previous_.forward_trend != analysis_.forward_trend;
  const bool side_changed = previous_.side_trend != analysis_.side_trend;
  const bool height_changed = std::abs(previous_.average_height - analysis_.average_height) >
                              config_.height_change_log_threshold;
  if (!trend_changed && !side_changed && !height_changed) return;

  std::ostringstream line;
  line.setf(std::ios::fixed);
  line.precision(3);
  line << "TerrainDetector: pass=" << analysis_.pass;
  if (trend_changed) {
    line << " trend " << forward_trend_name(previous_.forward_trend) << "->"
         << forward_trend_name(analysis_.forward_trend);
  }
  if (side_changed) {
    line << " side " << side_trend_name(previous_.side_trend) << "->"
         << side_trend_name(analysis_.side_trend);
  }
  if (height_changed) {
    line << " avg_height " << previous_.average_height << "->" << analysis_.average_height;
  }
  if (trend_changed || side_changed) {
    log::info(line.str());
  } else {
    log::debug(line.str());
  }
  if (movement_log::enabled()) {
    movement_log::write(line.str());
  }
}

void TerrainDetector::draw_debug(DebugDrawSink& sink) const {
  for (const auto& s : samples_) {
    const Vec3 ground{s.position.x, s.ground_height, s.position.z};
    if (!s.has_ground) {
      sink.point(s.position, 0.02f, {1.0f, 0.0f, 0.0f});
      continue;
    }
    sink.point(ground, 0.03f, category_color(s.category));
    sink.line(ground, vec3_add(ground, vec3_mul(s.normal, 0.1f)), category_color(s.category));
  }
  for (const auto& zone : analysis_.steppable_zones) {
    sink.point(zone.position, 0.02f + 0.04f * zone.quality, {0.0f, zone.quality, 0.0f});
  }
}

} // namespace lcm
