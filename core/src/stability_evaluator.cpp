#include "lcm/stability_evaluator.h"

#include "lcm/log.h"

#include <algorithm>
#include <cmath>

namespace lcm {

namespace {

Vec2 v2_sub(const Vec2& a, const Vec2& b) {
  return {a.x - b.x, a.y - b.y};
}

float v2_length(const Vec2& v) {
  return std::sqrt(v.x * v.x + v.y * v.y);
}

Vec2 v2_normalize(const Vec2& v) {
  const float len = v2_length(v);
  if (len < kEps) return {0.0f, 0.0f};
  return {v.x / len, v.y / len};
}

float v2_dot(const Vec2& a, const Vec2& b) {
  return a.x * b.x + a.y * b.y;
}

// Outward normal of edge a->b for the given winding; zero for degenerate edges.
Vec2 edge_normal(const Vec2& a, const Vec2& b, bool ccw) {
  const Vec2 e = v2_normalize(v2_sub(b, a));
  if (e.x == 0.0f && e.y == 0.0f) return {0.0f, 0.0f};
  return ccw ? Vec2{e.y, -e.x} : Vec2{-e.y, e.x};
}

uint64_t cell_key(float x, float z, float cell) {
  const auto ix = static_cast<int32_t>(std::floor(x / cell));
  const auto iz = static_cast<int32_t>(std::floor(z / cell));
  return (static_cast<uint64_t>(static_cast<uint32_t>(ix)) << 32) |
         static_cast<uint64_t>(static_cast<uint32_t>(iz));
}

Vec3 zone_color(size_t idx) {
  switch (idx) {
    case 0: return {0.1f, 0.9f, 0.1f};
    case 1: return {0.9f, 0.9f, 0.1f};
    case 2: return {1.0f, 0.5f, 0.0f};
    default: return {1.0f, 0.1f, 0.1f};
  }
}

} // namespace

const char* stability_zone_name(StabilityZone zone) {
  switch (zone) {
    case StabilityZone::Stable: return "stable";
    case StabilityZone::Marginal: return "marginal";
    case StabilityZone::Unstable: return "unstable";
    case StabilityZone::Critical: return "critical";
  }
  return "critical";
}

bool point_in_polygon(const Vec2& p, const Polygon2& poly) {
  bool inside = false;
  const size_t n = poly.size();
  if (n < 3) return false;
  for (size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2& a = poly[i];
    const Vec2& b = poly[j];
    if ((a.y > p.y) != (b.y > p.y)) {
      const float x_cross = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
      if (p.x < x_cross) {
        inside = !inside;
      }
    }
  }
  return inside;
}

float polygon_signed_area(const Polygon2& poly) {
  float area = 0.0f;
  const size_t n = poly.size();
  for (size_t i = 0; i < n; ++i) {
    const Vec2& a = poly[i];
    const Vec2& b = poly[(i + 1) % n];
    area += a.x * b.y - b.x * a.y;
  }
  return 0.5f * area;
}

Vec2 polygon_centroid(const Polygon2& poly) {
  if (poly.empty()) return {0.0f, 0.0f};
  Vec2 sum{0.0f, 0.0f};
  for (const auto& p : poly) {
    sum.x += p.x;
    sum.y += p.y;
  }
  const float inv = 1.0f / static_cast<float>(poly.size());
  return {sum.x * inv, sum.y * inv};
}

Polygon2 offset_polygon(const Polygon2& poly, float offset, float min_corner_dot) {
  const size_t n = poly.size();
  if (n < 3) return poly;
  const bool ccw = polygon_signed_area(poly) >= 0.0f;

  std::vector<Vec2> normals(n);
  for (size_t i = 0; i < n; ++i) {
    normals[i] = edge_normal(poly[i], poly[(i + 1) % n], ccw);
  }

  Polygon2 out(n);
  for (size_t i = 0; i < n; ++i) {
    // Walk past degenerate edges so coincident vertices still move outward.
    Vec2 n_prev{0.0f, 0.0f};
    for (size_t k = 1; k <= n; ++k) {
      const Vec2& cand = normals[(i + n - k) % n];
      if (cand.x != 0.0f || cand.y != 0.0f) {
        n_prev = cand;
        break;
      }
    }
    Vec2 n_next{0.0f, 0.0f};
    for (size_t k = 0; k < n; ++k) {
      const Vec2& cand = normals[(i + k) % n];
      if (cand.x != 0.0f || cand.y != 0.0f) {
        n_next = cand;
        break;
      }
    }
    const Vec2 dir = v2_normalize({n_prev.x + n_next.x, n_prev.y + n_next.y});
    if (dir.x == 0.0f && dir.y == 0.0f) {
      out[i] = poly[i];
      continue;
    }
    const float scale = 1.0f / std::max(min_corner_dot, v2_dot(dir, n_next));
    out[i] = {poly[i].x + dir.x * offset * scale, poly[i].y + dir.y * offset * scale};
  }
  return out;
}

StabilityEvaluator::StabilityEvaluator(const StabilityEvaluatorConfig& config,
                                       const GroundQueryProvider* ground)
    : config_(config), ground_(ground) {
  config_.cache_cell_size = std::max(config_.cache_cell_size, 0.001f);
}

float StabilityEvaluator::cached_ground_height(const Vec3& p) {
  const uint64_t key = cell_key(p.x, p.z, config_.cache_cell_size);
  auto it = height_cache_.find(key);
  if (it != height_cache_.end()) {
    return it->second;
  }
  if (height_cache_.size() >= config_.max_cache_entries) {
    height_cache_.clear();
  }
  const Vec3 from = vec3_add(p, vec3_mul(up_axis(), config_.ray_start_height));
  const Vec3 to = vec3_sub(p, vec3_mul(up_axis(), config_.ray_length));
  const GroundHit hit = ground_->cast_down(from, to, config_.collision_mask);
  ++raycast_count_;
  const float height = hit.hit ? hit.position.y : p.y;
  height_cache_.emplace(key, height);
  return height;
}

StabilityZone StabilityEvaluator::update(const Vec3& left_foot, const Vec3& right_foot,
                                         const Vec3& facing, const Vec3& center_of_gravity) {
  Vec3 fwd = vec3_normalize(vec3_horizontal(facing));
  if (vec3_length_sq(fwd) < 0.5f) {
    fwd = {0.0f, 0.0f, 1.0f};
  }
  const Vec3 reach = vec3_mul(fwd, config_.support_depth);
  corners_[0] = vec3_add(left_foot, reach);
  corners_[1] = vec3_add(right_foot, reach);
  corners_[2] = vec3_sub(right_foot, reach);
  corners_[3] = vec3_sub(left_foot, reach);

  if (config_.terrain_aligned) {
    if (!ground_) {
      if (!reported_no_ground_) {
        log::error("StabilityEvaluator: terrain alignment requested without ground provider");
        reported_no_ground_ = true;
      }
    } else {
      for (auto& c : corners_) {
        c.y = cached_ground_height(c);
      }
    }
  }

  Polygon2 base;
  base.reserve(4);
  for (const auto& c : corners_) {
    base.push_back(vec3_to_xz(c));
  }
  zones_[0] = base;
  zones_[1] = offset_polygon(base, config_.marginal_offset, config_.min_corner_dot);
  zones_[2] = offset_polygon(base, config_.unstable_offset, config_.min_corner_dot);
  zones_[3] = offset_polygon(base, config_.critical_offset, config_.min_corner_dot);
  center_ = polygon_centroid(base);
  cog_ = center_of_gravity;

  zone_ = classify(vec3_to_xz(center_of_gravity));
  return zone_;
}

bool StabilityEvaluator::contains(StabilityZone zone, const Vec2& p) const {
  return point_in_polygon(p, zones_[static_cast<size_t>(zone)]);
}

StabilityZone StabilityEvaluator::classify(const Vec2& p) const {
  if (contains(StabilityZone::Stable, p)) return StabilityZone::Stable;
  if (contains(StabilityZone::Marginal, p)) return StabilityZone::Marginal;
  if (contains(StabilityZone::Unstable, p)) return StabilityZone::Unstable;
  return StabilityZone::Critical;
}

void StabilityEvaluator::draw_debug(DebugDrawSink& sink) const {
  float y = 0.0f;
  for (const auto& c : corners_) y += c.y;
  y *= 0.25f;
  for (size_t z = 0; z < zones_.size(); ++z) {
    const Polygon2& poly = zones_[z];
    for (size_t i = 0; i < poly.size(); ++i) {
      const Vec2& a = poly[i];
      const Vec2& b = poly[(i + 1) % poly.size()];
      sink.line({a.x, y, a.y}, {b.x, y, b.y}, zone_color(z));
    }
  }
  sink.point({cog_.x, y, cog_.z}, 0.04f, zone_color(static_cast<size_t>(zone_)));
}

} // namespace lcm
