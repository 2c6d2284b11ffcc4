#include "lcm/center_of_gravity.h"
#include "lcm/foot_ik.h"
#include "lcm/goal_stepping.h"
#include "lcm/ground_field.h"
#include "lcm/log.h"
#include "lcm/terrain_detector.h"
#include "test_support.h"

#include <cmath>
#include <iostream>

int main() {
  lcm::log::init("lcm_test_foot_ik", test::scratch_dir("foot_ik"));

  int failures = 0;

  // Test: influence blends in on the ground and out in the air.
  {
    lcm::GroundField ground;
    ground.add_flat(0.0f);
    lcm::TerrainDetector terrain({}, &ground);
    lcm::CenterOfGravity cog({});
    lcm::GoalStepping stepping({}, lcm::default_gait_curves(), &terrain, &cog);
    auto body = test::body_at({0.0f, 0.0f, 0.0f});
    cog.update(body);
    stepping.initialize(body);

    lcm::FootIkBridge bridge;
    if (bridge.effector(lcm::FootSide::Left).influence != 0.0f) {
      std::cerr << "influence should start at zero\n";
      ++failures;
    }
    bridge.apply(stepping, body, 0.1f);
    const float in = 1.0f - std::exp(-1.0f);
    if (!test::near(bridge.effector(lcm::FootSide::Left).influence, in) ||
        !test::near(bridge.effector(lcm::FootSide::Right).influence, in)) {
      std::cerr << "blend-in rate wrong\n";
      ++failures;
    }
    if (!test::near3(bridge.effector(lcm::FootSide::Right).position,
                     stepping.foot(lcm::FootSide::Right).target)) {
      std::cerr << "effector should carry the foot target\n";
      ++failures;
    }

    const lcm::Vec3 animated{0.0f, 1.0f, 0.0f};
    const lcm::Vec3 blended = bridge.blend(animated, lcm::FootSide::Left);
    const lcm::Vec3 expected = lcm::vec3_lerp(animated, stepping.foot(lcm::FootSide::Left).target, in);
    if (!test::near3(blended, expected)) {
      std::cerr << "blend should lerp by influence\n";
      ++failures;
    }

    body.on_ground = false;
    bridge.apply(stepping, body, 0.1f);
    const float out = in * std::exp(-0.6f);
    if (!test::near(bridge.effector(lcm::FootSide::Left).influence, out)) {
      std::cerr << "blend-out rate wrong\n";
      ++failures;
    }

    body.on_ground = true;
    bridge.set_enabled(false);
    for (int i = 0; i < 100; ++i) bridge.apply(stepping, body, 0.1f);
    if (bridge.effector(lcm::FootSide::Left).influence > 1e-3f) {
      std::cerr << "disabled bridge should fade out\n";
      ++failures;
    }
    bridge.set_enabled(true);
    for (int i = 0; i < 100; ++i) bridge.apply(stepping, body, 0.1f);
    if (bridge.effector(lcm::FootSide::Left).influence < 0.999f ||
        bridge.effector(lcm::FootSide::Left).influence > 1.0f) {
      std::cerr << "influence should settle at one\n";
      ++failures;
    }
  }

  // Test: the bridge places hips and knees for the stepping targets.
  {
    lcm::GroundField ground;
    ground.add_flat(0.0f);
    lcm::TerrainDetector terrain({}, &ground);
    lcm::CenterOfGravity cog({});
    lcm::GoalStepping stepping({}, lcm::default_gait_curves(), &terrain, &cog);
    const auto body = test::body_at({0.0f, 0.0f, 0.0f});
    cog.update(body);
    stepping.initialize(body);

    lcm::FootIkConfig cfg;
    cfg.hip_height = 0.8f;
    lcm::FootIkBridge bridge(cfg);
    bridge.apply(stepping, body, 0.1f);
    for (lcm::FootSide side : {lcm::FootSide::Left, lcm::FootSide::Right}) {
      const auto& e = bridge.effector(side);
      const float sign = side == lcm::FootSide::Left ? -1.0f : 1.0f;
      if (!test::near3(e.hip, {sign * 0.1f, 0.8f, 0.0f})) {
        std::cerr << foot_side_name(side) << " hip misplaced\n";
        ++failures;
      }
      if (!e.reached || !test::near3(e.ankle, e.position, 1e-3f)) {
        std::cerr << foot_side_name(side) << " ankle should reach the foot target\n";
        ++failures;
      }
      if (!test::near(lcm::vec3_distance(e.hip, e.knee), 0.45f, 1e-3f) ||
          !test::near(lcm::vec3_distance(e.knee, e.ankle), 0.45f, 1e-3f)) {
        std::cerr << foot_side_name(side) << " leg bone lengths not kept\n";
        ++failures;
      }
      if (e.knee.z <= 0.05f) {
        std::cerr << foot_side_name(side) << " knee should bend forward\n";
        ++failures;
      }
    }

    cfg.solve_legs = false;
    lcm::FootIkBridge unsolved(cfg);
    unsolved.apply(stepping, body, 0.1f);
    if (!test::near3(unsolved.effector(lcm::FootSide::Left).knee, {0.0f, 0.0f, 0.0f})) {
      std::cerr << "knees should stay unset without the leg solve\n";
      ++failures;
    }
  }

  // Test: two-bone solve for a reachable target.
  {
    const lcm::Vec3 hip{0.0f, 1.0f, 0.0f};
    const float l1 = 0.5f;
    const float l2 = 0.5f;
    const lcm::Vec3 target{0.0f, 0.3f, 0.2f};
    const auto r = lcm::solve_two_bone(hip, l1, l2, target, {0.0f, 0.5f, 1.0f});
    if (!r.reached || !test::near3(r.ankle, target)) {
      std::cerr << "reachable target should be reached\n";
      ++failures;
    }
    if (!test::near(lcm::vec3_distance(r.knee, hip), l1, 1e-3f) ||
        !test::near(lcm::vec3_distance(r.knee, target), l2, 1e-3f)) {
      std::cerr << "bone lengths not preserved\n";
      ++failures;
    }
    if (r.knee.z <= 0.1f) {
      std::cerr << "knee should bend toward the pole\n";
      ++failures;
    }
  }

  // Test: unreachable target straightens the leg.
  {
    const lcm::Vec3 hip{0.0f, 1.0f, 0.0f};
    const auto r = lcm::solve_two_bone(hip, 0.5f, 0.5f, {0.0f, -3.0f, 0.0f}, {0.0f, 0.5f, 1.0f});
    if (r.reached) {
      std::cerr << "target beyond reach reported reached\n";
      ++failures;
    }
    if (!test::near(lcm::vec3_distance(r.ankle, hip), 0.999f, 1e-3f) || std::fabs(r.knee.z) > 0.05f) {
      std::cerr << "leg should be almost straight toward the target\n";
      ++failures;
    }
  }

  // Test: the previous bend direction keeps the knee from flipping.
  {
    lcm::Vec3 prev{0.0f, 0.0f, 1.0f};
    const auto r = lcm::solve_two_bone({0.0f, 1.0f, 0.0f}, 0.5f, 0.5f, {0.0f, 0.3f, 0.0f},
                                       {0.0f, 0.5f, -1.0f}, &prev);
    if (r.knee.z <= 0.0f || prev.z <= 0.0f || r.continuity < 0.0f) {
      std::cerr << "knee flipped despite the previous bend direction\n";
      ++failures;
    }
  }

  lcm::log::shutdown();
  return failures == 0 ? 0 : 1;
}
