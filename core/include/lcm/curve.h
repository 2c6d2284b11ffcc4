#pragma once

#include <initializer_list>
#include <vector>

namespace lcm {

struct CurvePoint {
  float x = 0.0f;
  float y = 0.0f;
};

// Piecewise-linear response curve. Points are kept sorted by x; sampling
// clamps to the end points outside the covered range.
class ResponseCurve {
 public:
  ResponseCurve() = default;
  ResponseCurve(std::initializer_list<CurvePoint> points);
  explicit ResponseCurve(std::vector<CurvePoint> points);

  static ResponseCurve constant(float y);
  static ResponseCurve linear(float x0, float y0, float x1, float y1);

  float sample(float x) const;
  bool empty() const { return points_.empty(); }
  bool is_monotonic() const;
  const std::vector<CurvePoint>& points() const { return points_; }

 private:
  void sort_points();

  std::vector<CurvePoint> points_;
};

} // namespace lcm
