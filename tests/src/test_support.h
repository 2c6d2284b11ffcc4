#pragma once

#include "lcm/log.h"
#include "lcm/math.h"
#include "lcm/world.h"

#include <cmath>
#include <filesystem>
#include <string>

namespace test {

inline bool near(float a, float b, float eps = 1e-4f) {
  return std::fabs(a - b) <= eps;
}

inline bool near3(const lcm::Vec3& a, const lcm::Vec3& b, float eps = 1e-4f) {
  return near(a.x, b.x, eps) && near(a.y, b.y, eps) && near(a.z, b.z, eps);
}

// Log lines currently in the ring that contain `needle`.
inline int count_log_lines(const std::string& needle) {
  int n = 0;
  for (const auto& line : lcm::log::recent()) {
    if (line.find(needle) != std::string::npos) ++n;
  }
  return n;
}

inline std::filesystem::path scratch_dir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "lcm_tests" / name;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return dir;
}

inline lcm::BodyState body_at(const lcm::Vec3& position, const lcm::Vec3& velocity = {0.0f, 0.0f, 0.0f},
                              float yaw = 0.0f) {
  lcm::BodyState body;
  body.position = position;
  body.velocity = velocity;
  body.basis = lcm::basis_from_yaw(yaw);
  return body;
}

// Body state holder for components that pull state through PhysicsBodyState.
class FixedBody : public lcm::PhysicsBodyState {
 public:
  lcm::BodyState body_state() const override { return state; }

  lcm::BodyState state = body_at({0.0f, 0.0f, 0.0f});
};

} // namespace test
