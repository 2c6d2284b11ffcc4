#include "lcm/curve.h"

#include <algorithm>

namespace lcm {

ResponseCurve::ResponseCurve(std::initializer_list<CurvePoint> points) : points_(points) {
  sort_points();
}

ResponseCurve::ResponseCurve(std::vector<CurvePoint> points) : points_(std::move(points)) {
  sort_points();
}

ResponseCurve ResponseCurve::constant(float y) {
  return ResponseCurve({CurvePoint{0.0f, y}});
}

ResponseCurve ResponseCurve::linear(float x0, float y0, float x1, float y1) {
  return ResponseCurve({CurvePoint{x0, y0}, CurvePoint{x1, y1}});
}

void ResponseCurve::sort_points() {
  std::stable_sort(points_.begin(), points_.end(),
                   [](const CurvePoint& a, const CurvePoint& b) { return a.x < b.x; });
}

float ResponseCurve::sample(float x) const {
  if (points_.empty()) return 0.0f;
  if (x <= points_.front().x) return points_.front().y;
  if (x >= points_.back().x) return points_.back().y;
  for (size_t i = 1; i < points_.size(); ++i) {
    const CurvePoint& a = points_[i - 1];
    const CurvePoint& b = points_[i];
    if (x > b.x) continue;
    const float span = b.x - a.x;
    if (span <= 0.0f) return b.y;
    const float t = (x - a.x) / span;
    return a.y + (b.y - a.y) * t;
  }
  return points_.back().y;
}

bool ResponseCurve::is_monotonic() const {
  bool non_decreasing = true;
  bool non_increasing = true;
  for (size_t i = 1; i < points_.size(); ++i) {
    if (points_[i].y < points_[i - 1].y) non_decreasing = false;
    if (points_[i].y > points_[i - 1].y) non_increasing = false;
  }
  return non_decreasing || non_increasing;
}

} // namespace lcm
