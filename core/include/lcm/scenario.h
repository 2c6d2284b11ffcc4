#pragma once

#include "lcm/ground_field.h"

#include <filesystem>
#include <string>
#include <vector>

namespace lcm {

enum class GroundShape : uint8_t {
  Flat = 0,
  Plane = 1,
  Box = 2,
  Ramp = 3,
  Stairs = 4
};

struct GroundSpec {
  GroundShape shape = GroundShape::Flat;
  uint32_t layer = 1;
  float height = 0.0f;
  // plane
  Vec3 normal{0.0f, 1.0f, 0.0f};
  float distance = 0.0f;
  // box
  Vec3 center{0.0f, 0.0f, 0.0f};
  Vec3 half_extents{0.5f, 0.5f, 0.5f};
  // ramp / stairs footprint
  float min_x = -1.0f;
  float max_x = 1.0f;
  float z0 = 0.0f;
  float z1 = 1.0f;
  float rise_deg = 10.0f;
  float step_depth = 0.3f;
  float step_rise = 0.15f;
  int steps = 4;
};

// Scripted run for the simulator: ground primitives plus body keyframes.
struct Scenario {
  std::string name = "unnamed";
  float dt = 1.0f / 60.0f;
  float duration = 5.0f;
  Vec3 start{0.0f, 0.0f, 0.0f};
  uint32_t collision_mask = 1;
  std::vector<GroundSpec> ground;
  std::vector<BodyKeyframe> keyframes;
};

bool parse_ground_shape(const std::string& name, GroundShape& out);
const char* ground_shape_name(GroundShape shape);

bool load_scenario(const std::filesystem::path& path, Scenario& out, std::string& error);
void build_ground(const Scenario& scenario, GroundField& field);
int scenario_frame_count(const Scenario& scenario);

} // namespace lcm
