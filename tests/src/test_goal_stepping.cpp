#include "lcm/center_of_gravity.h"
#include "lcm/goal_stepping.h"
#include "lcm/ground_field.h"
#include "lcm/log.h"
#include "lcm/terrain_detector.h"
#include "test_support.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace {

struct Rig {
  explicit Rig(const lcm::GoalSteppingConfig& cfg = {}, float floor = 0.0f)
      : terrain({}, &ground), cog({}), stepping(cfg, lcm::default_gait_curves(), &terrain, &cog) {
    ground.add_flat(floor);
  }

  void tick(const lcm::BodyState& body, float dt) {
    cog.update(body);
    stepping.update(body, dt);
  }

  lcm::GroundField ground;
  lcm::TerrainDetector terrain;
  lcm::CenterOfGravity cog;
  lcm::GoalStepping stepping;
};

int side_index(lcm::FootSide side) {
  return side == lcm::FootSide::Left ? 0 : 1;
}

} // namespace

int main() {
  lcm::log::init("lcm_test_stepping", test::scratch_dir("stepping"));

  int failures = 0;
  const float dt = 1.0f / 60.0f;

  // Test: initialization plants a symmetric idle stance.
  {
    Rig rig;
    const auto body = test::body_at({0.0f, 0.0f, 0.0f});
    rig.cog.update(body);
    if (!rig.stepping.initialize(body) || !rig.stepping.initialized()) {
      std::cerr << "stepping should initialize with valid collaborators\n";
      ++failures;
    }
    const auto& left = rig.stepping.foot(lcm::FootSide::Left);
    const auto& right = rig.stepping.foot(lcm::FootSide::Right);
    if (!test::near3(left.target, {-0.125f, 0.0f, 0.0f}) || !test::near3(right.target, {0.125f, 0.0f, 0.0f})) {
      std::cerr << "idle stance should be symmetric about the body\n";
      ++failures;
    }
    if (!rig.stepping.both_planted() || left.progress != 1.0f || right.progress != 1.0f) {
      std::cerr << "both feet should start planted\n";
      ++failures;
    }
    for (int i = 0; i < 120; ++i) {
      rig.tick(body, dt);
      if (!rig.stepping.started_steps().empty()) {
        std::cerr << "standing still should not trigger steps\n";
        ++failures;
        break;
      }
    }
    if (rig.stepping.moving() || rig.stepping.idle_time() < 1.9f) {
      std::cerr << "idle time should accumulate while standing\n";
      ++failures;
    }
  }

  // Test: walking alternates feet with one foot in the air at most.
  {
    Rig rig;
    auto body = test::body_at({0.0f, 0.0f, 0.0f});
    rig.cog.update(body);
    rig.stepping.initialize(body);
    body.velocity = {0.0f, 0.0f, 1.5f};

    std::vector<lcm::FootSide> starts;
    float last_land[2] = {-1.0f, -1.0f};
    float prev_progress[2] = {1.0f, 1.0f};
    bool both_airborne = false;
    bool progress_regressed = false;
    bool stance_violated = false;
    bool start_not_zero = false;
    bool land_not_snapped = false;
    float time = 0.0f;

    for (int i = 0; i < 360; ++i) {
      body.position.z += body.velocity.z * dt;
      time += dt;
      rig.tick(body, dt);

      const auto& stepping = rig.stepping;
      if (stepping.foot(lcm::FootSide::Left).stepping() && stepping.foot(lcm::FootSide::Right).stepping()) {
        both_airborne = true;
      }
      for (const auto& ev : stepping.started_steps()) {
        const int idx = side_index(ev.side);
        starts.push_back(ev.side);
        if (stepping.foot(ev.side).progress != 0.0f) start_not_zero = true;
        if (last_land[idx] >= 0.0f &&
            time - last_land[idx] < stepping.gait().min_stance_duration - 1e-4f) {
          stance_violated = true;
        }
        prev_progress[idx] = 0.0f;
      }
      for (const auto& ev : stepping.landed_steps()) {
        const auto& f = stepping.foot(ev.side);
        if (f.progress != 1.0f || !test::near3(f.target, f.ideal_position)) land_not_snapped = true;
        last_land[side_index(ev.side)] = time;
      }
      for (lcm::FootSide side : {lcm::FootSide::Left, lcm::FootSide::Right}) {
        const auto& f = stepping.foot(side);
        const int idx = side_index(side);
        if (f.stepping() && f.progress < prev_progress[idx]) progress_regressed = true;
        prev_progress[idx] = f.progress;
      }
    }

    if (both_airborne) {
      std::cerr << "both feet were stepping at once\n";
      ++failures;
    }
    if (starts.size() < 6) {
      std::cerr << "expected a steady walk, got " << starts.size() << " steps\n";
      ++failures;
    }
    for (size_t i = 1; i < starts.size(); ++i) {
      if (starts[i] == starts[i - 1]) {
        std::cerr << "feet did not alternate at step " << i << "\n";
        ++failures;
        break;
      }
    }
    if (progress_regressed || start_not_zero || land_not_snapped) {
      std::cerr << "step progress not monotonic from 0 to 1\n";
      ++failures;
    }
    if (stance_violated) {
      std::cerr << "a foot lifted before its minimum stance time\n";
      ++failures;
    }
    for (lcm::FootSide side : {lcm::FootSide::Left, lcm::FootSide::Right}) {
      if (std::fabs(rig.stepping.foot(side).target.z - body.position.z) > 1.0f) {
        std::cerr << foot_side_name(side) << " foot fell behind the body\n";
        ++failures;
      }
    }
    if (!test::near3(rig.stepping.move_direction(), {0.0f, 0.0f, 1.0f}, 1e-3f)) {
      std::cerr << "move direction should settle on the velocity direction\n";
      ++failures;
    }
  }

  // Test: reversing the velocity turns the stride around.
  {
    Rig rig;
    auto body = test::body_at({0.0f, 0.0f, 0.0f});
    rig.cog.update(body);
    rig.stepping.initialize(body);

    body.velocity = {0.0f, 0.0f, 1.5f};
    for (int i = 0; i < 120; ++i) {
      body.position.z += body.velocity.z * dt;
      rig.tick(body, dt);
    }

    body.velocity = {0.0f, 0.0f, -1.5f};
    int late_landings = 0;
    bool landed_behind = false;
    for (int i = 0; i < 300; ++i) {
      body.position.z += body.velocity.z * dt;
      rig.tick(body, dt);
      if (i < 60) continue;
      for (const auto& ev : rig.stepping.landed_steps()) {
        ++late_landings;
        if (ev.position.z - body.position.z > -0.05f) landed_behind = true;
      }
    }

    if (!test::near3(rig.stepping.move_direction(), {0.0f, 0.0f, -1.0f}, 1e-3f)) {
      const auto d = rig.stepping.move_direction();
      std::cerr << "move direction did not reverse: (" << d.x << "," << d.y << "," << d.z << ")\n";
      ++failures;
    }
    if (late_landings < 4) {
      std::cerr << "expected steady steps after reversing, got " << late_landings << "\n";
      ++failures;
    }
    if (landed_behind) {
      std::cerr << "a foot landed behind the body after reversing\n";
      ++failures;
    }
    for (lcm::FootSide side : {lcm::FootSide::Left, lcm::FootSide::Right}) {
      if (rig.stepping.foot(side).orientation.forward.z > -0.99f) {
        std::cerr << foot_side_name(side) << " foot still faces the old direction\n";
        ++failures;
      }
    }
  }

  // Test: walking backward from an idle stance.
  {
    Rig rig;
    auto body = test::body_at({0.0f, 0.0f, 0.0f});
    rig.cog.update(body);
    rig.stepping.initialize(body);
    body.velocity = {0.0f, 0.0f, -1.0f};
    for (int i = 0; i < 120; ++i) {
      body.position.z += body.velocity.z * dt;
      rig.tick(body, dt);
    }
    if (!test::near3(rig.stepping.move_direction(), {0.0f, 0.0f, -1.0f}, 1e-3f)) {
      std::cerr << "backward walk should turn the move direction around\n";
      ++failures;
    }
  }

  // Test: swing height follows a sine arc above the ground.
  {
    Rig rig;
    auto body = test::body_at({0.0f, 0.0f, 0.0f});
    rig.cog.update(body);
    rig.stepping.initialize(body);
    body.velocity = {0.0f, 0.0f, 1.0f};
    float peak = 0.0f;
    for (int i = 0; i < 120; ++i) {
      body.position.z += body.velocity.z * dt;
      rig.tick(body, dt);
      for (lcm::FootSide side : {lcm::FootSide::Left, lcm::FootSide::Right}) {
        const auto& f = rig.stepping.foot(side);
        if (f.target.y < -1e-4f) {
          std::cerr << "swinging foot dipped below flat ground\n";
          ++failures;
          i = 120;
          break;
        }
        if (f.stepping()) {
          const float expected = f.arc_height * std::sin(f.progress * lcm::kPi);
          if (!test::near(f.target.y, expected, 1e-3f)) {
            std::cerr << "swing height off the arc\n";
            ++failures;
            i = 120;
            break;
          }
          peak = std::max(peak, f.target.y);
        }
      }
    }
    if (peak <= 0.05f) {
      std::cerr << "swing never lifted the foot\n";
      ++failures;
    }
  }

  // Test: ideal positions sit on the terrain plus the configured offset.
  {
    lcm::GoalSteppingConfig cfg;
    cfg.foot_height_offset = 0.02f;
    Rig rig(cfg, 0.3f);
    const auto body = test::body_at({0.0f, 0.3f, 0.0f});
    rig.cog.update(body);
    rig.stepping.initialize(body);
    if (!test::near(rig.stepping.foot(lcm::FootSide::Left).target.y, 0.32f) ||
        !test::near(rig.stepping.foot(lcm::FootSide::Right).ideal_position.y, 0.32f)) {
      std::cerr << "foot height should follow terrain plus offset\n";
      ++failures;
    }
  }

  // Test: idle stabilization shifts the stance toward the CoG offset.
  {
    Rig rig;
    const auto body = test::body_at({0.0f, 0.0f, 0.0f});
    rig.cog.update(body);
    rig.stepping.initialize(body);
    rig.cog.set_external_offset({0.0f, 0.0f, 0.1f});
    for (int i = 0; i < 20; ++i) rig.tick(body, dt);
    if (!test::near(rig.stepping.foot(lcm::FootSide::Left).ideal_position.z, 0.0f)) {
      std::cerr << "stabilization should wait for the idle delay\n";
      ++failures;
    }
    int started = 0;
    for (int i = 0; i < 120; ++i) {
      rig.tick(body, dt);
      started += static_cast<int>(rig.stepping.started_steps().size());
    }
    if (!test::near(rig.stepping.foot(lcm::FootSide::Left).ideal_position.z, 0.1f) ||
        !test::near(rig.stepping.foot(lcm::FootSide::Right).ideal_position.z, 0.1f)) {
      std::cerr << "idle stance should follow the CoG offset\n";
      ++failures;
    }
    if (started == 0) {
      std::cerr << "a 10cm shift should trigger a corrective step\n";
      ++failures;
    }
    rig.cog.set_external_offset({0.0f, 0.0f, 0.5f});
    rig.tick(body, dt);
    if (!test::near(rig.stepping.foot(lcm::FootSide::Left).ideal_position.z, 0.15f)) {
      std::cerr << "idle stabilization should clamp to its maximum\n";
      ++failures;
    }
  }

  // Test: an unstable hint lowers the trigger distance when enabled.
  {
    const auto body = test::body_at({0.0f, 0.0f, 0.0f});
    auto run = [&](bool use_hint) {
      lcm::GoalSteppingConfig cfg;
      cfg.use_stability_trigger = use_hint;
      Rig rig(cfg);
      rig.cog.update(body);
      rig.stepping.initialize(body);
      rig.cog.set_external_offset({0.0f, 0.0f, 0.06f});
      rig.stepping.set_stability_hint(lcm::StabilityZone::Unstable);
      int started = 0;
      for (int i = 0; i < 120; ++i) {
        rig.tick(body, dt);
        started += static_cast<int>(rig.stepping.started_steps().size());
      }
      return started;
    };
    if (run(false) != 0) {
      std::cerr << "6cm drift is below the idle trigger distance\n";
      ++failures;
    }
    if (run(true) == 0) {
      std::cerr << "unstable hint should trigger a corrective step\n";
      ++failures;
    }
  }

  // Test: arc height grows only when stepping uphill.
  {
    Rig rig;
    const auto body = test::body_at({0.0f, 0.0f, 0.0f});
    rig.cog.update(body);
    rig.stepping.initialize(body);
    const float base = rig.stepping.gait().step_height;
    const float a = lcm::deg_to_rad(20.0f);
    const lcm::Vec3 ramp_normal{0.0f, std::cos(a), -std::sin(a)};
    const lcm::Vec3 origin{0.0f, 0.0f, 0.0f};
    const float up = rig.stepping.slope_adjusted_height(origin, {0.0f, 0.0f, 0.5f}, ramp_normal);
    if (!test::near(up, base * (1.0f + (20.0f / 90.0f) * 1.5f))) {
      std::cerr << "uphill arc height wrong: " << up << "\n";
      ++failures;
    }
    if (!test::near(rig.stepping.slope_adjusted_height(origin, {0.0f, 0.0f, -0.5f}, ramp_normal), base)) {
      std::cerr << "downhill steps should keep the base height\n";
      ++failures;
    }
    if (!test::near(rig.stepping.slope_adjusted_height(origin, {0.5f, 0.0f, 0.0f}, ramp_normal), base)) {
      std::cerr << "steps across the slope should keep the base height\n";
      ++failures;
    }
    const float g = lcm::deg_to_rad(3.0f);
    if (!test::near(rig.stepping.slope_adjusted_height(origin, {0.0f, 0.0f, 0.5f},
                                                       {0.0f, std::cos(g), -std::sin(g)}),
                    base)) {
      std::cerr << "gentle slopes should keep the base height\n";
      ++failures;
    }
  }

  // Test: missing collaborators disable stepping and report once.
  {
    lcm::CenterOfGravity cog({});
    lcm::GoalStepping stepping({}, lcm::default_gait_curves(), nullptr, &cog);
    const auto body = test::body_at({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f});
    const int before = test::count_log_lines("GoalStepping: terrain detector missing");
    if (stepping.initialize(body) || stepping.enabled()) {
      std::cerr << "stepping without terrain should be disabled\n";
      ++failures;
    }
    stepping.update(body, dt);
    stepping.update(body, dt);
    if (test::count_log_lines("GoalStepping: terrain detector missing") != before + 1) {
      std::cerr << "configuration error should be logged once\n";
      ++failures;
    }
    if (!stepping.started_steps().empty() || stepping.initialized()) {
      std::cerr << "disabled stepping should not produce output\n";
      ++failures;
    }

    lcm::TerrainDetector unconfigured({}, nullptr);
    lcm::GoalStepping lazy({}, lcm::default_gait_curves(), &unconfigured, &cog);
    lazy.update(body, dt);
    if (lazy.enabled()) {
      std::cerr << "unconfigured terrain detector should disable stepping\n";
      ++failures;
    }
  }

  lcm::log::shutdown();
  return failures == 0 ? 0 : 1;
}
