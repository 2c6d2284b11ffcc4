#include "lcm/scenario.h"

#include "lcm/log.h"
#include "lcm/math.h"

#include <cmath>
#include <fstream>

#if LCM_ENABLE_DATA_JSON
#include <nlohmann/json.hpp>
#endif

#if LCM_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace lcm {

bool parse_ground_shape(const std::string& name, GroundShape& out) {
  if (name == "flat") out = GroundShape::Flat;
  else if (name == "plane") out = GroundShape::Plane;
  else if (name == "box") out = GroundShape::Box;
  else if (name == "ramp") out = GroundShape::Ramp;
  else if (name == "stairs") out = GroundShape::Stairs;
  else return false;
  return true;
}

const char* ground_shape_name(GroundShape shape) {
  switch (shape) {
    case GroundShape::Flat: return "flat";
    case GroundShape::Plane: return "plane";
    case GroundShape::Box: return "box";
    case GroundShape::Ramp: return "ramp";
    case GroundShape::Stairs: return "stairs";
  }
  return "flat";
}

namespace {

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

void load_yaml(const std::filesystem::path& path, Scenario& sc) {
  const YAML::Node root = YAML::LoadFile(path.string());
  yaml_read(root, "name", sc.name);
  yaml_read(root, "dt", sc.dt);
  yaml_read(root, "duration", sc.duration);
  yaml_read_vec3(root, "start", sc.start);
  yaml_read(root, "collision_mask", sc.collision_mask);

  for (const auto& g : root["ground"]) {
    GroundSpec spec;
    const std::string shape = g["type"] ? g["type"].as<std::string>() : "flat";
    if (!parse_ground_shape(shape, spec.shape)) {
      throw YAML::Exception(g.Mark(), "unknown ground type '" + shape + "'");
    }
    yaml_read(g, "layer", spec.layer);
    yaml_read(g, "height", spec.height);
    yaml_read_vec3(g, "normal", spec.normal);
    yaml_read(g, "distance", spec.distance);
    yaml_read_vec3(g, "center", spec.center);
    yaml_read_vec3(g, "half_extents", spec.half_extents);
    yaml_read(g, "min_x", spec.min_x);
    yaml_read(g, "max_x", spec.max_x);
    yaml_read(g, "z0", spec.z0);
    yaml_read(g, "z1", spec.z1);
    yaml_read(g, "rise_deg", spec.rise_deg);
    yaml_read(g, "step_depth", spec.step_depth);
    yaml_read(g, "step_rise", spec.step_rise);
    yaml_read(g, "steps", spec.steps);
    sc.ground.push_back(spec);
  }

  for (const auto& k : root["keyframes"]) {
    BodyKeyframe key;
    yaml_read(k, "time", key.time);
    yaml_read_vec3(k, "velocity", key.velocity);
    if (k["yaw_deg"]) key.yaw = deg_to_rad(k["yaw_deg"].as<float>());
    sc.keyframes.push_back(key);
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

bool load_json(const std::filesystem::path& path, Scenario& sc, std::string& error) {
  std::ifstream in(path);
  nlohmann::json root;
  in >> root;
  json_read(root, "name", sc.name);
  json_read(root, "dt", sc.dt);
  json_read(root, "duration", sc.duration);
  json_read_vec3(root, "start", sc.start);
  json_read(root, "collision_mask", sc.collision_mask);

  if (root.contains("ground")) {
    for (const auto& g : root["ground"]) {
      GroundSpec spec;
      const std::string shape = g.value("type", std::string("flat"));
      if (!parse_ground_shape(shape, spec.shape)) {
        error = "unknown ground type '" + shape + "'";
        return false;
      }
      json_read(g, "layer", spec.layer);
      json_read(g, "height", spec.height);
      json_read_vec3(g, "normal", spec.normal);
      json_read(g, "distance", spec.distance);
      json_read_vec3(g, "center", spec.center);
      json_read_vec3(g, "half_extents", spec.half_extents);
      json_read(g, "min_x", spec.min_x);
      json_read(g, "max_x", spec.max_x);
      json_read(g, "z0", spec.z0);
      json_read(g, "z1", spec.z1);
      json_read(g, "rise_deg", spec.rise_deg);
      json_read(g, "step_depth", spec.step_depth);
      json_read(g, "step_rise", spec.step_rise);
      json_read(g, "steps", spec.steps);
      sc.ground.push_back(spec);
    }
  }

  if (root.contains("keyframes")) {
    for (const auto& k : root["keyframes"]) {
      BodyKeyframe key;
      json_read(k, "time", key.time);
      json_read_vec3(k, "velocity", key.velocity);
      if (k.contains("yaw_deg")) key.yaw = deg_to_rad(k["yaw_deg"].get<float>());
      sc.keyframes.push_back(key);
    }
  }
  return true;
}
#endif

} // namespace

bool load_scenario(const std::filesystem::path& path, Scenario& out, std::string& error) {
  out = Scenario{};
  error.clear();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    error = "scenario not found: " + path.string();
    return false;
  }

  Scenario sc;
  const auto ext = path.extension().string();
  if (ext == ".json") {
#if LCM_ENABLE_DATA_JSON
    try {
      if (!load_json(path, sc, error)) {
        error = path.string() + ": " + error;
        return false;
      }
    } catch (const nlohmann::json::exception& e) {
      error = path.string() + ": " + e.what();
      return false;
    }
#else
    error = "JSON scenario requested but JSON support is disabled";
    return false;
#endif
  } else if (ext == ".yaml" || ext == ".yml") {
#if LCM_ENABLE_DATA_YAML
    try {
      load_yaml(path, sc);
    } catch (const YAML::Exception& e) {
      error = path.string() + ": " + e.what();
      return false;
    }
#else
    error = "YAML scenario requested but YAML support is disabled";
    return false;
#endif
  } else {
    error = "unknown scenario extension: " + ext;
    return false;
  }

  if (sc.dt <= 0.0f) {
    error = path.string() + ": dt must be positive";
    return false;
  }
  if (sc.ground.empty()) {
    log::warn("scenario '" + sc.name + "' has no ground; adding a flat floor at 0");
    sc.ground.push_back(GroundSpec{});
  }
  out = sc;
  return true;
}

void build_ground(const Scenario& scenario, GroundField& field) {
  field.clear();
  for (const auto& g : scenario.ground) {
    switch (g.shape) {
      case GroundShape::Flat:
        field.add_flat(g.height, g.layer);
        break;
      case GroundShape::Plane: {
        GroundPlane plane;
        plane.normal = vec3_normalize(g.normal);
        plane.distance = g.distance;
        plane.layer = g.layer;
        field.add_plane(plane);
        break;
      }
      case GroundShape::Box:
        field.add_box({g.center, g.half_extents, g.layer});
        break;
      case GroundShape::Ramp:
        field.add_ramp(g.min_x, g.max_x, g.z0, g.z1, g.height, g.rise_deg, g.layer);
        break;
      case GroundShape::Stairs:
        field.add_stairs(g.min_x, g.max_x, g.z0, g.step_depth, g.step_rise, g.steps, g.layer);
        break;
    }
  }
}

int scenario_frame_count(const Scenario& scenario) {
  if (scenario.dt <= 0.0f || scenario.duration <= 0.0f) return 0;
  return static_cast<int>(std::ceil(scenario.duration / scenario.dt - 1e-4f));
}

} // namespace lcm
