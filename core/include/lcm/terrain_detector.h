#pragma once

#include "lcm/world.h"

#include <cstdint>
#include <string>
#include <vector>

namespace lcm {

enum class SampleCategory : uint8_t {
  Near = 0,
  Far = 1,
  Forward = 2,
  Query = 3,
  Path = 4
};

enum class ForwardTrend : uint8_t {
  Stationary = 0,
  Flat = 1,
  Ascending = 2,
  Descending = 3
};

enum class SideTrend : uint8_t {
  Level = 0,
  LeftHigh = 1,
  RightHigh = 2
};

// What to do with the analysis when every probe of a pass misses.
enum class EmptyAnalysisPolicy : uint8_t {
  RetainPrevious = 0,
  Reset = 1
};

const char* sample_category_name(SampleCategory category);
const char* forward_trend_name(ForwardTrend trend);
const char* side_trend_name(SideTrend trend);
bool parse_empty_analysis_policy(const std::string& name, EmptyAnalysisPolicy& out);

struct TerrainSample {
  Vec3 position{0.0f, 0.0f, 0.0f};
  float ground_height = 0.0f;
  bool has_ground = false;
  Vec3 normal{0.0f, 1.0f, 0.0f};
  float slope_deg = 0.0f;
  SampleCategory category = SampleCategory::Query;
};

struct SteppableZone {
  Vec3 position{0.0f, 0.0f, 0.0f};
  float height = 0.0f;
  float slope_deg = 0.0f;
  float quality = 0.0f;
};

struct TerrainAnalysis {
  bool valid = false;
  bool stale = false;
  float average_height = 0.0f;
  float height_variance = 0.0f;
  float roughness = 0.0f;
  float max_slope_deg = 0.0f;
  ForwardTrend forward_trend = ForwardTrend::Stationary;
  float forward_height_delta = 0.0f;
  float side_slope_deg = 0.0f;
  SideTrend side_trend = SideTrend::Level;
  std::vector<SteppableZone> steppable_zones;
  size_t sample_count = 0;
  size_t hit_count = 0;
  uint64_t pass = 0;
};

struct TerrainDetectorConfig {
  float ray_start_height = 1.0f;
  float ray_length = 3.0f;
  uint32_t collision_mask = 1;
  int near_samples = 16;
  int far_samples = 32;
  float near_radius = 0.5f;
  float far_radius = 1.5f;
  int forward_bias_samples = 4;
  float step_height_threshold = 0.3f;
  float steep_slope_threshold = 35.0f;
  float trend_threshold = 0.1f;
  float side_probe_offset = 0.5f;
  float side_level_threshold = 0.02f;
  float movement_threshold = 0.1f;
  float height_change_log_threshold = 0.05f;
  EmptyAnalysisPolicy empty_policy = EmptyAnalysisPolicy::RetainPrevious;
};

class TerrainDetector {
 public:
  TerrainDetector(const TerrainDetectorConfig& config, const GroundQueryProvider* ground);

  bool configured() const { return ground_ != nullptr; }

  TerrainSample sample_at(const Vec3& world_pos,
                          SampleCategory category = SampleCategory::Query) const;
  std::vector<TerrainSample> sample_path(const Vec3& from, const Vec3& to, int count) const;
  float ground_height_at(const Vec3& world_pos) const;
  Vec3 ground_normal_at(const Vec3& world_pos) const;

  // One full pass: rings, forward bias, side probes, aggregates.
  const TerrainAnalysis& update_terrain_analysis(const BodyState& body);

  const TerrainAnalysis& analysis() const { return analysis_; }
  const TerrainAnalysis& previous_analysis() const { return previous_; }
  const std::vector<TerrainSample>& samples() const { return samples_; }
  const TerrainDetectorConfig& config() const { return config_; }

  void draw_debug(DebugDrawSink& sink) const;

 private:
  void collect_ring(const Vec3& center, float radius, int count, SampleCategory category);
  void collect_forward(const Vec3& center, const Vec3& move_dir);
  void log_changes() const;

  TerrainDetectorConfig config_;
  const GroundQueryProvider* ground_ = nullptr;
  std::vector<TerrainSample> samples_;
  TerrainAnalysis analysis_;
  TerrainAnalysis previous_;
  bool all_missed_ = false;
  bool reported_unconfigured_ = false;
};

} // namespace lcm
