#include "lcm/config.h"

#include <fstream>
#include <vector>

#if LCM_ENABLE_DATA_JSON
#include <nlohmann/json.hpp>
#endif

#if LCM_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace lcm {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void apply_curve(ResponseCurve& curve, std::vector<CurvePoint> points, const char* name) {
  if (points.empty()) {
    log::warn(std::string("config: gait curve '") + name + "' has no points; keeping default");
    return;
  }
  curve = ResponseCurve(std::move(points));
  if (!curve.is_monotonic()) {
    log::debug(std::string("config: gait curve '") + name + "' is not monotonic");
  }
}

void apply_empty_policy(TerrainDetectorConfig& cfg, const std::string& name) {
  EmptyAnalysisPolicy policy;
  if (parse_empty_analysis_policy(name, policy)) {
    cfg.empty_policy = policy;
  } else {
    log::warn("config: unknown terrain.empty_policy '" + name + "'");
  }
}

void apply_log_level(LcmConfig& cfg, const std::string& name) {
  log::Level level;
  if (log::parse_level(name, level)) {
    cfg.log_level = level;
  } else {
    log::warn("config: unknown log level '" + name + "'");
  }
}

#if LCM_ENABLE_DATA_YAML
template <typename T>
void yaml_read(const YAML::Node& node, const char* key, T& out) {
  if (node[key]) out = node[key].as<T>();
}

void yaml_read_vec3(const YAML::Node& node, const char* key, Vec3& out) {
  const YAML::Node v = node[key];
  if (!v) return;
  if (!v.IsSequence() || v.size() != 3) {
    throw YAML::Exception(v.Mark(), std::string(key) + " must be [x, y, z]");
  }
  out = {v[0].as<float>(), v[1].as<float>(), v[2].as<float>()};
}

void yaml_read_curve(const YAML::Node& node, const char* key, ResponseCurve& out) {
  const YAML::Node v = node[key];
  if (!v) return;
  std::vector<CurvePoint> points;
  for (const auto& p : v) {
    if (!p.IsSequence() || p.size() != 2) {
      throw YAML::Exception(p.Mark(), std::string(key) + " points must be [x, y]");
    }
    points.push_back({p[0].as<float>(), p[1].as<float>()});
  }
  apply_curve(out, std::move(points), key);
}

void load_yaml(const std::filesystem::path& path, LcmConfig& cfg) {
  YAML::Node doc = YAML::LoadFile(path.string());
  const YAML::Node root = doc["lcm"] ? doc["lcm"] : doc;

  if (root["log_level"]) apply_log_level(cfg, root["log_level"].as<std::string>());
  yaml_read(root, "debug_draw", cfg.debug_draw);

  if (const YAML::Node t = root["terrain"]) {
    auto& c = cfg.terrain;
    yaml_read(t, "ray_start_height", c.ray_start_height);
    yaml_read(t, "ray_length", c.ray_length);
    yaml_read(t, "collision_mask", c.collision_mask);
    yaml_read(t, "near_samples", c.near_samples);
    yaml_read(t, "far_samples", c.far_samples);
    yaml_read(t, "near_radius", c.near_radius);
    yaml_read(t, "far_radius", c.far_radius);
    yaml_read(t, "forward_bias_samples", c.forward_bias_samples);
    yaml_read(t, "step_height_threshold", c.step_height_threshold);
    yaml_read(t, "steep_slope_threshold", c.steep_slope_threshold);
    yaml_read(t, "trend_threshold", c.trend_threshold);
    yaml_read(t, "side_probe_offset", c.side_probe_offset);
    yaml_read(t, "side_level_threshold", c.side_level_threshold);
    yaml_read(t, "movement_threshold", c.movement_threshold);
    yaml_read(t, "height_change_log_threshold", c.height_change_log_threshold);
    if (t["empty_policy"]) apply_empty_policy(c, t["empty_policy"].as<std::string>());
  }

  if (const YAML::Node g = root["center_of_gravity"]) {
    auto& c = cfg.center_of_gravity;
    yaml_read_vec3(g, "base_offset", c.base_offset);
    yaml_read(g, "speed_threshold", c.speed_threshold);
    yaml_read(g, "forward_offset", c.forward_offset);
    yaml_read(g, "backward_offset", c.backward_offset);
    yaml_read(g, "lateral_offset", c.lateral_offset);
    yaml_read(g, "lateral_dead_zone", c.lateral_dead_zone);
    yaml_read(g, "movement_threshold", c.movement_threshold);
    yaml_read(g, "stabilization_strength", c.stabilization_strength);
    yaml_read(g, "max_stabilization_distance", c.max_stabilization_distance);
  }

  if (const YAML::Node s = root["stepping"]) {
    auto& c = cfg.stepping;
    yaml_read(s, "max_speed_reference", c.max_speed_reference);
    yaml_read(s, "movement_threshold", c.movement_threshold);
    yaml_read(s, "input_smoothing_tau", c.input_smoothing_tau);
    yaml_read(s, "foot_height_offset", c.foot_height_offset);
    yaml_read(s, "idle_stabilization", c.idle_stabilization);
    yaml_read(s, "idle_stabilization_delay", c.idle_stabilization_delay);
    yaml_read(s, "idle_stabilization_influence", c.idle_stabilization_influence);
    yaml_read(s, "max_idle_stabilization", c.max_idle_stabilization);
    yaml_read(s, "slope_min_deg", c.slope_min_deg);
    yaml_read(s, "slope_height_multiplier", c.slope_height_multiplier);
    yaml_read(s, "align_to_terrain", c.align_to_terrain);
    yaml_read(s, "use_stability_trigger", c.use_stability_trigger);
    yaml_read(s, "stability_trigger_scale", c.stability_trigger_scale);
  }

  if (const YAML::Node g = root["gait"]) {
    yaml_read_curve(g, "step_length", cfg.gait.step_length);
    yaml_read_curve(g, "step_frequency", cfg.gait.step_frequency);
    yaml_read_curve(g, "stance_width", cfg.gait.stance_width);
    yaml_read_curve(g, "stance_ratio", cfg.gait.stance_ratio);
    yaml_read_curve(g, "step_height", cfg.gait.step_height);
    yaml_read_curve(g, "trigger_distance", cfg.gait.trigger_distance);
  }

  if (const YAML::Node s = root["stability"]) {
    auto& c = cfg.stability;
    yaml_read(s, "support_depth", c.support_depth);
    yaml_read(s, "marginal_offset", c.marginal_offset);
    yaml_read(s, "unstable_offset", c.unstable_offset);
    yaml_read(s, "critical_offset", c.critical_offset);
    yaml_read(s, "min_corner_dot", c.min_corner_dot);
    yaml_read(s, "terrain_aligned", c.terrain_aligned);
    yaml_read(s, "collision_mask", c.collision_mask);
    yaml_read(s, "ray_start_height", c.ray_start_height);
    yaml_read(s, "ray_length", c.ray_length);
    yaml_read(s, "cache_cell_size", c.cache_cell_size);
    yaml_read(s, "max_cache_entries", c.max_cache_entries);
  }

  if (const YAML::Node k = root["foot_ik"]) {
    yaml_read(k, "enabled", cfg.foot_ik.enabled);
    yaml_read(k, "blend_in_rate", cfg.foot_ik.blend_in_rate);
    yaml_read(k, "blend_out_rate", cfg.foot_ik.blend_out_rate);
    yaml_read(k, "solve_legs", cfg.foot_ik.solve_legs);
    yaml_read(k, "hip_half_width", cfg.foot_ik.hip_half_width);
    yaml_read(k, "hip_height", cfg.foot_ik.hip_height);
    yaml_read(k, "thigh_length", cfg.foot_ik.thigh_length);
    yaml_read(k, "shin_length", cfg.foot_ik.shin_length);
    yaml_read(k, "knee_pole_distance", cfg.foot_ik.knee_pole_distance);
  }
}
#endif

#if LCM_ENABLE_DATA_JSON
template <typename T>
void json_read(const nlohmann::json& node, const char* key, T& out) {
  if (node.contains(key)) out = node.at(key).get<T>();
}

void json_read_vec3(const nlohmann::json& node, const char* key, Vec3& out) {
  if (!node.contains(key)) return;
  const auto& v = node.at(key);
  out = {v.at(0).get<float>(), v.at(1).get<float>(), v.at(2).get<float>()};
}

void json_read_curve(const nlohmann::json& node, const char* key, ResponseCurve& out) {
  if (!node.contains(key)) return;
  std::vector<CurvePoint> points;
  for (const auto& p : node.at(key)) {
    points.push_back({p.at(0).get<float>(), p.at(1).get<float>()});
  }
  apply_curve(out, std::move(points), key);
}

void load_json(const std::filesystem::path& path, LcmConfig& cfg) {
  std::ifstream in(path);
  nlohmann::json j;
  in >> j;
  const auto& root = j.contains("lcm") ? j["lcm"] : j;

  if (root.contains("log_level")) apply_log_level(cfg, root["log_level"].get<std::string>());
  json_read(root, "debug_draw", cfg.debug_draw);

  if (root.contains("terrain")) {
    const auto& t = root["terrain"];
    auto& c = cfg.terrain;
    json_read(t, "ray_start_height", c.ray_start_height);
    json_read(t, "ray_length", c.ray_length);
    json_read(t, "collision_mask", c.collision_mask);
    json_read(t, "near_samples", c.near_samples);
    json_read(t, "far_samples", c.far_samples);
    json_read(t, "near_radius", c.near_radius);
    json_read(t, "far_radius", c.far_radius);
    json_read(t, "forward_bias_samples", c.forward_bias_samples);
    json_read(t, "step_height_threshold", c.step_height_threshold);
    json_read(t, "steep_slope_threshold", c.steep_slope_threshold);
    json_read(t, "trend_threshold", c.trend_threshold);
    json_read(t, "side_probe_offset", c.side_probe_offset);
    json_read(t, "side_level_threshold", c.side_level_threshold);
    json_read(t, "movement_threshold", c.movement_threshold);
    json_read(t, "height_change_log_threshold", c.height_change_log_threshold);
    if (t.contains("empty_policy")) apply_empty_policy(c, t["empty_policy"].get<std::string>());
  }

  if (root.contains("center_of_gravity")) {
    const auto& g = root["center_of_gravity"];
    auto& c = cfg.center_of_gravity;
    json_read_vec3(g, "base_offset", c.base_offset);
    json_read(g, "speed_threshold", c.speed_threshold);
    json_read(g, "forward_offset", c.forward_offset);
    json_read(g, "backward_offset", c.backward_offset);
    json_read(g, "lateral_offset", c.lateral_offset);
    json_read(g, "lateral_dead_zone", c.lateral_dead_zone);
    json_read(g, "movement_threshold", c.movement_threshold);
    json_read(g, "stabilization_strength", c.stabilization_strength);
    json_read(g, "max_stabilization_distance", c.max_stabilization_distance);
  }

  if (root.contains("stepping")) {
    const auto& s = root["stepping"];
    auto& c = cfg.stepping;
    json_read(s, "max_speed_reference", c.max_speed_reference);
    json_read(s, "movement_threshold", c.movement_threshold);
    json_read(s, "input_smoothing_tau", c.input_smoothing_tau);
    json_read(s, "foot_height_offset", c.foot_height_offset);
    json_read(s, "idle_stabilization", c.idle_stabilization);
    json_read(s, "idle_stabilization_delay", c.idle_stabilization_delay);
    json_read(s, "idle_stabilization_influence", c.idle_stabilization_influence);
    json_read(s, "max_idle_stabilization", c.max_idle_stabilization);
    json_read(s, "slope_min_deg", c.slope_min_deg);
    json_read(s, "slope_height_multiplier", c.slope_height_multiplier);
    json_read(s, "align_to_terrain", c.align_to_terrain);
    json_read(s, "use_stability_trigger", c.use_stability_trigger);
    json_read(s, "stability_trigger_scale", c.stability_trigger_scale);
  }

  if (root.contains("gait")) {
    const auto& g = root["gait"];
    json_read_curve(g, "step_length", cfg.gait.step_length);
    json_read_curve(g, "step_frequency", cfg.gait.step_frequency);
    json_read_curve(g, "stance_width", cfg.gait.stance_width);
    json_read_curve(g, "stance_ratio", cfg.gait.stance_ratio);
    json_read_curve(g, "step_height", cfg.gait.step_height);
    json_read_curve(g, "trigger_distance", cfg.gait.trigger_distance);
  }

  if (root.contains("stability")) {
    const auto& s = root["stability"];
    auto& c = cfg.stability;
    json_read(s, "support_depth", c.support_depth);
    json_read(s, "marginal_offset", c.marginal_offset);
    json_read(s, "unstable_offset", c.unstable_offset);
    json_read(s, "critical_offset", c.critical_offset);
    json_read(s, "min_corner_dot", c.min_corner_dot);
    json_read(s, "terrain_aligned", c.terrain_aligned);
    json_read(s, "collision_mask", c.collision_mask);
    json_read(s, "ray_start_height", c.ray_start_height);
    json_read(s, "ray_length", c.ray_length);
    json_read(s, "cache_cell_size", c.cache_cell_size);
    json_read(s, "max_cache_entries", c.max_cache_entries);
  }

  if (root.contains("foot_ik")) {
    const auto& k = root["foot_ik"];
    json_read(k, "enabled", cfg.foot_ik.enabled);
    json_read(k, "blend_in_rate", cfg.foot_ik.blend_in_rate);
    json_read(k, "blend_out_rate", cfg.foot_ik.blend_out_rate);
    json_read(k, "solve_legs", cfg.foot_ik.solve_legs);
    json_read(k, "hip_half_width", cfg.foot_ik.hip_half_width);
    json_read(k, "hip_height", cfg.foot_ik.hip_height);
    json_read(k, "thigh_length", cfg.foot_ik.thigh_length);
    json_read(k, "shin_length", cfg.foot_ik.shin_length);
    json_read(k, "knee_pole_distance", cfg.foot_ik.knee_pole_distance);
  }
}
#endif
} // namespace

bool load_lcm_config(const std::filesystem::path& path, LcmConfig& out, std::string& error) {
  out = LcmConfig{};
  error.clear();

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return true;
  }

  LcmConfig cfg;
  const auto ext = path.extension().string();
  if (ext == ".json") {
#if LCM_ENABLE_DATA_JSON
    try {
      load_json(path, cfg);
    } catch (const nlohmann::json::exception& e) {
      error = path.string() + ": " + e.what();
      return false;
    }
    out = cfg;
#else
    log::warn("JSON config requested but JSON support is disabled.");
#endif
    return true;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if LCM_ENABLE_DATA_YAML
    try {
      load_yaml(path, cfg);
    } catch (const YAML::Exception& e) {
      error = path.string() + ": " + e.what();
      return false;
    }
    out = cfg;
#else
    log::warn("YAML config requested but YAML support is disabled.");
#endif
    return true;
  }

  log::warn("Unknown config extension; using defaults.");
  return true;
}

LcmConfig load_lcm_config(const std::filesystem::path& path) {
  LcmConfig cfg;
  std::string error;
  if (!load_lcm_config(path, cfg, error)) {
    log::error("config: " + error);
    return LcmConfig{};
  }
  return cfg;
}

} // namespace lcm
