#pragma once

#include "lcm/config.h"
#include "lcm/scenario.h"

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

struct SimulateOptions {
  std::filesystem::path scenario_path;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> out_path;
  std::optional<std::filesystem::path> trace_path;
  std::optional<int> frames;
};

struct GaitOptions {
  std::optional<std::filesystem::path> config_path;
  float speed = 0.0f;
};

// Runs the scenario through the locomotion system and returns the per-frame
// report (frames array plus a summary block).
nlohmann::json simulate_scenario(const lcm::Scenario& scenario, const lcm::LcmConfig& config,
                                 std::optional<int> frame_limit);
nlohmann::json gait_report(const lcm::LcmConfig& config, float speed);

// Accepts a decimal integer in [0, INT_MAX].
bool parse_frame_count(const std::string& text, int& out);

int run_simulate(const SimulateOptions& opts);
int run_gait(const GaitOptions& opts);
