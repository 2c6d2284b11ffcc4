#pragma once

#include "lcm/goal_stepping.h"
#include "lcm/stability_evaluator.h"

#include <any>
#include <functional>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace lcm {

struct StepStarted {
  FootSide side = FootSide::Left;
  Vec3 from{0.0f, 0.0f, 0.0f};
  uint64_t frame = 0;
};

struct StepLanded {
  FootSide side = FootSide::Left;
  Vec3 position{0.0f, 0.0f, 0.0f};
  uint32_t step_count = 0;
  uint64_t frame = 0;
};

struct StabilityChanged {
  StabilityZone previous = StabilityZone::Stable;
  StabilityZone current = StabilityZone::Stable;
  uint64_t frame = 0;
};

class EventBus {
 public:
  template <typename T>
  void subscribe(std::function<void(const T&)> handler) {
    auto& bucket = handlers_[std::type_index(typeid(T))];
    bucket.push_back([handler](const std::any& ev) {
      handler(std::any_cast<const T&>(ev));
    });
  }

  template <typename T>
  void emit(const T& event) {
    auto it = handlers_.find(std::type_index(typeid(T)));
    if (it == handlers_.end()) {
      return;
    }
    const std::any wrapped(event);
    for (auto& fn : it->second) {
      fn(wrapped);
    }
  }

  void clear() { handlers_.clear(); }

 private:
  std::unordered_map<std::type_index, std::vector<std::function<void(const std::any&)>>> handlers_;
};

} // namespace lcm
