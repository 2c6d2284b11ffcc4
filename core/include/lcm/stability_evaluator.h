#pragma once

#include "lcm/world.h"

#include <array>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace lcm {

// Ordered from most to least stable.
enum class StabilityZone : uint8_t {
  Stable = 0,
  Marginal = 1,
  Unstable = 2,
  Critical = 3
};

const char* stability_zone_name(StabilityZone zone);

using Polygon2 = std::vector<Vec2>;

// Even-odd crossing-number test.
bool point_in_polygon(const Vec2& p, const Polygon2& poly);
float polygon_signed_area(const Polygon2& poly);
Vec2 polygon_centroid(const Polygon2& poly);
// Grows the polygon outward by `offset`. Each vertex moves along the averaged
// normals of its two edges, scaled by 1 / max(min_corner_dot, dir . n_next).
Polygon2 offset_polygon(const Polygon2& poly, float offset, float min_corner_dot = 0.5f);

struct StabilityEvaluatorConfig {
  float support_depth = 0.12f; // forward/backward reach of each foot
  float marginal_offset = 0.05f;
  float unstable_offset = 0.12f;
  float critical_offset = 0.25f;
  float min_corner_dot = 0.5f;
  bool terrain_aligned = false;
  uint32_t collision_mask = 1;
  float ray_start_height = 0.5f;
  float ray_length = 1.5f;
  float cache_cell_size = 0.05f;
  size_t max_cache_entries = 512;
};

class StabilityEvaluator {
 public:
  StabilityEvaluator(const StabilityEvaluatorConfig& config, const GroundQueryProvider* ground);

  // Rebuilds the support zones from the feet and classifies the CoG.
  StabilityZone update(const Vec3& left_foot, const Vec3& right_foot, const Vec3& facing,
                       const Vec3& center_of_gravity);

  StabilityZone classify(const Vec2& p) const;
  bool contains(StabilityZone zone, const Vec2& p) const;

  StabilityZone zone() const { return zone_; }
  const std::array<Polygon2, 4>& zones() const { return zones_; }
  const std::array<Vec3, 4>& support_corners() const { return corners_; }
  Vec2 support_center() const { return center_; }
  size_t cache_size() const { return height_cache_.size(); }
  size_t raycast_count() const { return raycast_count_; }
  void clear_cache() { height_cache_.clear(); }

  const StabilityEvaluatorConfig& config() const { return config_; }

  void draw_debug(DebugDrawSink& sink) const;

 private:
  float cached_ground_height(const Vec3& p);

  StabilityEvaluatorConfig config_;
  const GroundQueryProvider* ground_ = nullptr;
  std::array<Vec3, 4> corners_{};
  std::array<Polygon2, 4> zones_;
  Vec2 center_{0.0f, 0.0f};
  Vec3 cog_{0.0f, 0.0f, 0.0f};
  StabilityZone zone_ = StabilityZone::Stable;
  std::unordered_map<uint64_t, float> height_cache_;
  size_t raycast_count_ = 0;
  bool reported_no_ground_ = false;
};

} // namespace lcm
