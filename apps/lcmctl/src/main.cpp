#include "lcm/config.h"
#include "lcm/ground_field.h"
#include "lcm/lcm_system.h"
#include "lcm/log.h"
#include "lcm/movement_log.h"
#include "lcm/scenario.h"
#include "lcmctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json vec3_json(const lcm::Vec3& v) {
  return json::array({v.x, v.y, v.z});
}

json foot_json(const lcm::FootStepState& f, const lcm::FootEffector& e) {
  json j;
  j["target"] = vec3_json(f.target);
  j["ideal"] = vec3_json(f.ideal_position);
  j["phase"] = f.stepping() ? "stepping" : "planted";
  j["progress"] = f.progress;
  j["stance_timer"] = f.stance_timer;
  j["step_count"] = f.step_count;
  j["ik_influence"] = e.influence;
  j["knee"] = vec3_json(e.knee);
  j["ik_reached"] = e.reached;
  return j;
}

json gait_json(const lcm::GaitState& g) {
  json j;
  j["speed"] = g.speed;
  j["speed_ratio"] = g.speed_ratio;
  j["step_length"] = g.step_length;
  j["step_frequency"] = g.step_frequency;
  j["step_duration"] = g.step_duration;
  j["stance_width"] = g.stance_width;
  j["stance_ratio"] = g.stance_ratio;
  j["step_height"] = g.step_height;
  j["trigger_distance"] = g.trigger_distance;
  j["min_stance_duration"] = g.min_stance_duration;
  return j;
}

bool resolve_config(const std::optional<fs::path>& path, lcm::LcmConfig& out) {
  out = lcm::LcmConfig{};
  if (!path) return true;
  std::string error;
  if (!lcm::load_lcm_config(*path, out, error)) {
    lcm::log::error("config: " + error);
    return false;
  }
  return true;
}

bool parse_float(const std::string& text, float& out) {
  char* end = nullptr;
  const float v = std::strtof(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') return false;
  out = v;
  return true;
}

} // namespace

bool parse_frame_count(const std::string& text, int& out) {
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE) return false;
  if (v < 0 || v > std::numeric_limits<int>::max()) return false;
  out = static_cast<int>(v);
  return true;
}

json simulate_scenario(const lcm::Scenario& scenario, const lcm::LcmConfig& config,
                       std::optional<int> frame_limit) {
  lcm::GroundField ground;
  lcm::build_ground(scenario, ground);
  lcm::KinematicBody body(&ground, scenario.start, scenario.collision_mask);
  body.set_keyframes(scenario.keyframes);

  lcm::LcmSystem system(config, &body, &ground);

  json report;
  report["scenario"] = scenario.name;
  report["dt"] = scenario.dt;
  json frames = json::array();
  json events = json::array();
  std::map<std::string, int> zone_counts;

  system.events().subscribe<lcm::StepStarted>([&events](const lcm::StepStarted& ev) {
    events.push_back({{"type", "step_started"}, {"frame", ev.frame}, {"foot", lcm::foot_side_name(ev.side)}});
  });
  system.events().subscribe<lcm::StepLanded>([&events](const lcm::StepLanded& ev) {
    events.push_back({{"type", "step_landed"},
                      {"frame", ev.frame},
                      {"foot", lcm::foot_side_name(ev.side)},
                      {"position", vec3_json(ev.position)}});
  });
  system.events().subscribe<lcm::StabilityChanged>([&events](const lcm::StabilityChanged& ev) {
    events.push_back({{"type", "stability_changed"},
                      {"frame", ev.frame},
                      {"from", lcm::stability_zone_name(ev.previous)},
                      {"to", lcm::stability_zone_name(ev.current)}});
  });

  const bool ok = system.initialize();
  report["initialized"] = ok;

  int count = lcm::scenario_frame_count(scenario);
  if (frame_limit && *frame_limit >= 0 && *frame_limit < count) count = *frame_limit;

  for (int i = 0; i < count; ++i) {
    body.step(scenario.dt);
    system.update(scenario.dt);

    const auto& stepping = system.stepping();
    const auto& analysis = system.terrain().analysis();
    json frame;
    frame["frame"] = i;
    frame["time"] = body.time();
    frame["body"] = {{"position", vec3_json(system.last_body().position)},
                     {"velocity", vec3_json(system.last_body().velocity)}};
    frame["gait"] = gait_json(stepping.gait());
    frame["feet"] = {{"left", foot_json(stepping.foot(lcm::FootSide::Left),
                                        system.foot_ik().effector(lcm::FootSide::Left))},
                     {"right", foot_json(stepping.foot(lcm::FootSide::Right),
                                         system.foot_ik().effector(lcm::FootSide::Right))}};
    frame["cog"] = vec3_json(system.center_of_gravity().world_position());
    frame["zone"] = lcm::stability_zone_name(system.zone());
    frame["terrain"] = {{"valid", analysis.valid},
                        {"stale", analysis.stale},
                        {"average_height", analysis.average_height},
                        {"roughness", analysis.roughness},
                        {"max_slope_deg", analysis.max_slope_deg},
                        {"forward_trend", lcm::forward_trend_name(analysis.forward_trend)},
                        {"side_trend", lcm::side_trend_name(analysis.side_trend)},
                        {"hit_count", analysis.hit_count}};
    frames.push_back(frame);
    ++zone_counts[lcm::stability_zone_name(system.zone())];
  }

  report["frames"] = frames;
  report["events"] = events;
  json summary;
  summary["frames"] = count;
  summary["left_steps"] = system.stepping().foot(lcm::FootSide::Left).step_count;
  summary["right_steps"] = system.stepping().foot(lcm::FootSide::Right).step_count;
  summary["zones"] = zone_counts;
  report["summary"] = summary;
  return report;
}

json gait_report(const lcm::LcmConfig& config, float speed) {
  const auto gait = lcm::sample_gait(config.gait, speed, config.stepping.max_speed_reference);
  return gait_json(gait);
}

int run_simulate(const SimulateOptions& opts) {
  lcm::LcmConfig config;
  if (!resolve_config(opts.config_path, config)) {
    return 1;
  }
  lcm::log::set_level(config.log_level);

  lcm::Scenario scenario;
  std::string error;
  if (!lcm::load_scenario(opts.scenario_path, scenario, error)) {
    lcm::log::error(error);
    return 1;
  }

  if (opts.trace_path) {
    lcm::movement_log::open(*opts.trace_path, "lcmctl simulate " + scenario.name);
  }
  const json report = simulate_scenario(scenario, config, opts.frames);
  const size_t trace_lines = lcm::movement_log::close();
  if (opts.trace_path) {
    lcm::log::info("simulate: trace " + opts.trace_path->string() + " (" +
                   std::to_string(trace_lines) + " lines)");
  }

  if (!report.value("initialized", false)) {
    lcm::log::error("simulate: locomotion system failed to initialize");
  }

  if (opts.out_path) {
    std::ofstream out(*opts.out_path);
    if (!out) {
      lcm::log::error("simulate: cannot write " + opts.out_path->string());
      return 1;
    }
    out << report.dump(2) << "\n";
    lcm::log::info("simulate: wrote " + opts.out_path->string());
  }
  std::cout << report["summary"].dump(2) << "\n";
  return report.value("initialized", false) ? 0 : 2;
}

int run_gait(const GaitOptions& opts) {
  lcm::LcmConfig config;
  if (!resolve_config(opts.config_path, config)) {
    return 1;
  }
  std::cout << gait_report(config, opts.speed).dump(2) << "\n";
  return 0;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  lcmctl simulate --scenario <file> [--config <file>] [--out <frames.json>] [--trace <trace.log>] [--frames <n>]\n"
            << "  lcmctl gait --speed <m/s> [--config <file>]\n";
}

#ifndef LCMCTL_LIB
int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  lcm::log::init("lcmctl", fs::current_path());

  int rc = 1;
  if (command == "simulate") {
    SimulateOptions opts;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--scenario" && i + 1 < argc) {
        opts.scenario_path = argv[++i];
      } else if (arg == "--config" && i + 1 < argc) {
        opts.config_path = fs::path(argv[++i]);
      } else if (arg == "--out" && i + 1 < argc) {
        opts.out_path = fs::path(argv[++i]);
      } else if (arg == "--trace" && i + 1 < argc) {
        opts.trace_path = fs::path(argv[++i]);
      } else if (arg == "--frames" && i + 1 < argc) {
        int n = 0;
        if (!parse_frame_count(argv[++i], n)) {
          std::cerr << "--frames expects a non-negative integer\n";
          lcm::log::shutdown();
          return 1;
        }
        opts.frames = n;
      }
    }
    if (opts.scenario_path.empty()) {
      print_usage();
    } else {
      rc = run_simulate(opts);
    }
  } else if (command == "gait") {
    GaitOptions opts;
    bool have_speed = false;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--speed" && i + 1 < argc) {
        have_speed = parse_float(argv[++i], opts.speed);
      } else if (arg == "--config" && i + 1 < argc) {
        opts.config_path = fs::path(argv[++i]);
      }
    }
    if (!have_speed) {
      print_usage();
    } else {
      rc = run_gait(opts);
    }
  } else {
    print_usage();
  }

  lcm::log::shutdown();
  return rc;
}
#endif
