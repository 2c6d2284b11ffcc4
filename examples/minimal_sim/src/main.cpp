#include "lcm/config.h"
#include "lcm/ground_field.h"
#include "lcm/lcm_system.h"
#include "lcm/log.h"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

// Counts primitives instead of rendering them.
class CountingSink : public lcm::DebugDrawSink {
 public:
  void line(const lcm::Vec3&, const lcm::Vec3&, const lcm::Vec3&) override { ++lines; }
  void point(const lcm::Vec3&, float, const lcm::Vec3&) override { ++points; }

  int lines = 0;
  int points = 0;
};

int main(int argc, char** argv) {
  lcm::log::init("lcm_minimal_sim", fs::current_path());

  lcm::LcmConfig config;
  if (argc > 1) {
    config = lcm::load_lcm_config(argv[1]);
  }
  config.debug_draw = true;
  lcm::log::set_level(config.log_level);

  lcm::GroundField ground;
  ground.add_flat(0.0f);
  ground.add_ramp(-2.0f, 2.0f, 2.0f, 6.0f, 0.0f, 12.0f);

  lcm::KinematicBody body(&ground, {0.0f, 0.0f, 0.0f});
  body.set_keyframes({{0.0f, {0.0f, 0.0f, 0.0f}, 0.0f},
                      {1.0f, {0.0f, 0.0f, 1.4f}, 0.0f},
                      {5.0f, {0.0f, 0.0f, 0.0f}, 0.0f}});

  lcm::LcmSystem system(config, &body, &ground);
  CountingSink sink;
  system.set_debug_sink(&sink);

  int landed = 0;
  system.events().subscribe<lcm::StepLanded>([&landed](const lcm::StepLanded& ev) {
    ++landed;
    std::ostringstream msg;
    msg << lcm::foot_side_name(ev.side) << " foot landed at (" << ev.position.x << ", "
        << ev.position.y << ", " << ev.position.z << ")";
    lcm::log::info(msg.str());
  });
  system.events().subscribe<lcm::StabilityChanged>([](const lcm::StabilityChanged& ev) {
    lcm::log::info(std::string("stability: ") + lcm::stability_zone_name(ev.current));
  });

  if (!system.initialize()) {
    lcm::log::shutdown();
    return 1;
  }

  const float dt = 1.0f / 60.0f;
  for (int i = 0; i < 7 * 60; ++i) {
    body.step(dt);
    system.update(dt);
  }

  std::ostringstream summary;
  summary << "frames=" << system.frame() << " steps=" << landed << " debug_lines=" << sink.lines
          << " debug_points=" << sink.points;
  lcm::log::info(summary.str());
  lcm::log::shutdown();
  return 0;
}
