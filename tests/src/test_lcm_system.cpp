#include "lcm/ground_field.h"
#include "lcm/lcm_system.h"
#include "lcm/log.h"
#include "lcm/movement_log.h"
#include "lcm/scenario.h"
#include "lcmctl/cli_api.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

class CountingSink : public lcm::DebugDrawSink {
 public:
  void line(const lcm::Vec3&, const lcm::Vec3&, const lcm::Vec3&) override { ++lines; }
  void point(const lcm::Vec3&, float, const lcm::Vec3&) override { ++points; }

  int lines = 0;
  int points = 0;
};

std::string read_text(const fs::path& path) {
  std::ifstream in(path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

int main() {
  const fs::path dir = test::scratch_dir("system");
  lcm::log::init("lcm_test_system", dir);

  int failures = 0;
  const float dt = 1.0f / 60.0f;

  // Test: a walk produces paired step events in frame order.
  {
    lcm::GroundField ground;
    ground.add_flat(0.0f);
    lcm::KinematicBody body(&ground, {0.0f, 0.0f, 0.0f});
    body.set_keyframes({{0.0f, {0.0f, 0.0f, 1.2f}, 0.0f}, {3.0f, {0.0f, 0.0f, 0.0f}, 0.0f}});

    lcm::LcmConfig cfg;
    cfg.debug_draw = true;
    lcm::LcmSystem system(cfg, &body, &ground);
    CountingSink sink;
    system.set_debug_sink(&sink);

    bool open[2] = {false, false};
    bool pairing_ok = true;
    uint64_t last_frame = 0;
    bool ordered = true;
    int started = 0;
    int landed = 0;
    system.events().subscribe<lcm::StepStarted>([&](const lcm::StepStarted& ev) {
      const int idx = ev.side == lcm::FootSide::Left ? 0 : 1;
      if (open[idx] || open[1 - idx]) pairing_ok = false;
      open[idx] = true;
      if (ev.frame < last_frame) ordered = false;
      last_frame = ev.frame;
      ++started;
    });
    system.events().subscribe<lcm::StepLanded>([&](const lcm::StepLanded& ev) {
      const int idx = ev.side == lcm::FootSide::Left ? 0 : 1;
      if (!open[idx]) pairing_ok = false;
      open[idx] = false;
      if (ev.frame < last_frame) ordered = false;
      last_frame = ev.frame;
      ++landed;
    });

    if (!system.initialize() || !system.enabled()) {
      std::cerr << "system should initialize on flat ground\n";
      ++failures;
    }
    for (int i = 0; i < 360; ++i) {
      body.step(dt);
      system.update(dt);
    }

    if (system.frame() != 360) {
      std::cerr << "frame counter wrong: " << system.frame() << "\n";
      ++failures;
    }
    if (started < 4 || landed < 4) {
      std::cerr << "expected several steps, got " << started << "/" << landed << "\n";
      ++failures;
    }
    if (!pairing_ok || !ordered) {
      std::cerr << "step events out of order\n";
      ++failures;
    }
    if (!system.stepping().both_planted() || system.zone() != lcm::StabilityZone::Stable) {
      std::cerr << "body at rest should end planted and stable\n";
      ++failures;
    }
    const lcm::Vec3 left = system.foot_ik().effector(lcm::FootSide::Left).position;
    const lcm::Vec3 expected_corner =
        lcm::vec3_add(left, lcm::vec3_mul(system.last_body().basis.forward, cfg.stability.support_depth));
    if (!test::near3(system.stability().support_corners()[0], expected_corner)) {
      std::cerr << "stability should use the IK effector positions\n";
      ++failures;
    }
    if (!test::near3(left, system.stepping().foot(lcm::FootSide::Left).target)) {
      std::cerr << "IK effector should follow the foot target\n";
      ++failures;
    }
    if (sink.lines == 0 || sink.points == 0) {
      std::cerr << "debug drawing produced nothing\n";
      ++failures;
    }
  }

  // Test: a pushed centre of gravity raises a stability change.
  {
    lcm::GroundField ground;
    ground.add_flat(0.0f);
    test::FixedBody body;
    lcm::LcmSystem system({}, &body, &ground);
    std::vector<lcm::StabilityChanged> changes;
    system.events().subscribe<lcm::StabilityChanged>(
        [&changes](const lcm::StabilityChanged& ev) { changes.push_back(ev); });
    system.initialize();
    system.update(dt);
    if (!changes.empty()) {
      std::cerr << "standing body should not change stability\n";
      ++failures;
    }
    system.set_external_cog_offset({0.0f, 0.0f, 1.0f});
    system.update(dt);
    if (changes.size() != 1 || changes[0].previous != lcm::StabilityZone::Stable ||
        changes[0].current != lcm::StabilityZone::Critical) {
      std::cerr << "push should report stable -> critical\n";
      ++failures;
    }
  }

  // Test: missing collaborators leave the system disabled.
  {
    test::FixedBody body;
    lcm::LcmSystem system({}, &body, nullptr);
    const int before = test::count_log_lines("LcmSystem: ground query provider missing");
    for (int i = 0; i < 3; ++i) system.update(dt);
    if (system.enabled() || system.frame() != 0) {
      std::cerr << "system without ground should stay disabled\n";
      ++failures;
    }
    if (test::count_log_lines("LcmSystem: ground query provider missing") != before + 1) {
      std::cerr << "missing ground should be logged once\n";
      ++failures;
    }

    lcm::GroundField ground;
    lcm::LcmSystem no_body({}, nullptr, &ground);
    if (no_body.initialize()) {
      std::cerr << "system without body should fail to initialize\n";
      ++failures;
    }
  }

  // Test: scenario simulation report and movement trace.
  {
    lcm::Scenario sc;
    sc.name = "walk";
    sc.dt = 0.02f;
    sc.duration = 2.0f;
    sc.ground.push_back(lcm::GroundSpec{});
    sc.keyframes.push_back({0.0f, {0.0f, 0.0f, 1.0f}, 0.0f});

    const fs::path trace = dir / "trace.log";
    lcm::movement_log::open(trace, "walk");
    const json report = simulate_scenario(sc, lcm::LcmConfig{}, std::nullopt);
    const size_t trace_lines = lcm::movement_log::close();
    if (trace_lines < 100) {
      std::cerr << "movement trace has fewer lines than frames\n";
      ++failures;
    }

    if (!report.value("initialized", false) || report["frames"].size() != 100) {
      std::cerr << "simulation report incomplete\n";
      ++failures;
    }
    const json& summary = report["summary"];
    if (summary.value("left_steps", 0) + summary.value("right_steps", 0) < 2) {
      std::cerr << "simulated walk took no steps\n";
      ++failures;
    }
    if (report["frames"][0]["feet"]["left"].value("phase", "").empty() ||
        report["frames"][0]["feet"]["left"]["knee"].size() != 3) {
      std::cerr << "frame report missing foot phase\n";
      ++failures;
    }
    const std::string text = read_text(trace);
    if (text.find("step_started") == std::string::npos || text.find("frame=") == std::string::npos ||
        text.rfind("# walk", 0) != 0) {
      std::cerr << "movement trace missing step lines\n";
      ++failures;
    }

    const json limited = simulate_scenario(sc, lcm::LcmConfig{}, 10);
    if (limited["frames"].size() != 10) {
      std::cerr << "frame limit not applied\n";
      ++failures;
    }
  }

  // Test: gait report.
  {
    const json g = gait_report(lcm::LcmConfig{}, 2.0f);
    if (!test::near(g.value("speed_ratio", 0.0f), 0.5f) || !test::near(g.value("step_length", 0.0f), 0.4f)) {
      std::cerr << "gait report wrong\n";
      ++failures;
    }
  }

#if LCM_ENABLE_DATA_JSON
  // Test: a malformed config stops the CLI commands instead of running on defaults.
  {
    const fs::path scenario = dir / "short_walk.json";
    {
      std::ofstream out(scenario);
      out << "{\"name\": \"short\", \"dt\": 0.02, \"duration\": 0.2,"
          << " \"ground\": [{\"type\": \"flat\"}],"
          << " \"keyframes\": [{\"time\": 0.0, \"velocity\": [0, 0, 1]}]}\n";
    }
    const fs::path broken = dir / "broken.json";
    {
      std::ofstream out(broken);
      out << "{\"stepping\": {\"max_speed_reference\": \n";
    }

    SimulateOptions sim;
    sim.scenario_path = scenario;
    if (run_simulate(sim) != 0) {
      std::cerr << "simulate without config should succeed\n";
      ++failures;
    }
    sim.config_path = broken;
    if (run_simulate(sim) == 0) {
      std::cerr << "simulate accepted a malformed config\n";
      ++failures;
    }

    GaitOptions gait;
    gait.speed = 1.0f;
    gait.config_path = broken;
    if (run_gait(gait) == 0) {
      std::cerr << "gait accepted a malformed config\n";
      ++failures;
    }
  }
#endif

  // Test: frame count parsing rejects junk and out-of-range values.
  {
    int n = -1;
    if (!parse_frame_count("120", n) || n != 120) {
      std::cerr << "frame count 120 not parsed\n";
      ++failures;
    }
    if (!parse_frame_count("0", n) || n != 0) {
      std::cerr << "frame count 0 not parsed\n";
      ++failures;
    }
    n = 7;
    const char* bad[] = {"", "12x", "-1", "4294967296", "99999999999999999999"};
    for (const char* text : bad) {
      if (parse_frame_count(text, n)) {
        std::cerr << "frame count accepted: '" << text << "'\n";
        ++failures;
      }
    }
    if (n != 7) {
      std::cerr << "rejected frame count modified the output\n";
      ++failures;
    }
  }

  lcm::log::shutdown();
  return failures == 0 ? 0 : 1;
}
