#include "lcm/ground_field.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace lcm {

namespace {

struct SegmentHit {
  bool hit = false;
  float t = 0.0f;
  Vec3 normal{0.0f, 1.0f, 0.0f};
};

bool segment_plane(const Vec3& origin, const Vec3& dir, float max_t, const GroundPlane& plane,
                   SegmentHit& out) {
  const Vec3 normal = vec3_normalize(plane.normal);
  if (vec3_length_sq(normal) < 0.5f) return false;
  const float denom = vec3_dot(normal, dir);
  if (std::abs(denom) < kEps) return false;
  const float t = (plane.distance - vec3_dot(normal, origin)) / denom;
  if (t < 0.0f || t > max_t) return false;
  if (plane.bounded) {
    const Vec3 p = vec3_add(origin, vec3_mul(dir, t));
    if (p.x < plane.min_x || p.x > plane.max_x || p.z < plane.min_z || p.z > plane.max_z) {
      return false;
    }
  }
  out.hit = true;
  out.t = t;
  out.normal = (denom > 0.0f) ? vec3_mul(normal, -1.0f) : normal;
  return true;
}

bool segment_aabb(const Vec3& origin, const Vec3& dir, const Vec3& box_center,
                  const Vec3& half_extents, float max_t, SegmentHit& out) {
  const Vec3 min_b = vec3_sub(box_center, half_extents);
  const Vec3 max_b = vec3_add(box_center, half_extents);
  float tmin = 0.0f;
  float tmax = max_t;
  Vec3 hit_normal{0.0f, 1.0f, 0.0f};
  const float o[3] = {origin.x, origin.y, origin.z};
  const float d[3] = {dir.x, dir.y, dir.z};
  const float bmin[3] = {min_b.x, min_b.y, min_b.z};
  const float bmax[3] = {max_b.x, max_b.y, max_b.z};

  for (int axis = 0; axis < 3; ++axis) {
    if (std::abs(d[axis]) < kEps) {
      if (o[axis] < bmin[axis] || o[axis] > bmax[axis]) {
        return false;
      }
      continue;
    }
    const float inv = 1.0f / d[axis];
    float t1 = (bmin[axis] - o[axis]) * inv;
    float t2 = (bmax[axis] - o[axis]) * inv;
    float n_sign = -1.0f;
    if (t1 > t2) {
      std::swap(t1, t2);
      n_sign = 1.0f;
    }
    if (t1 > tmin) {
      tmin = t1;
      hit_normal = {0.0f, 0.0f, 0.0f};
      if (axis == 0) hit_normal.x = n_sign;
      if (axis == 1) hit_normal.y = n_sign;
      if (axis == 2) hit_normal.z = n_sign;
    }
    if (t2 < tmax) {
      tmax = t2;
    }
    if (tmin > tmax) {
      return false;
    }
  }

  // Origin inside the box: report the top face.
  if (tmin <= 0.0f) {
    tmin = 0.0f;
    hit_normal = up_axis();
  }
  if (tmin > max_t) return false;
  out.hit = true;
  out.t = tmin;
  out.normal = hit_normal;
  return true;
}

} // namespace

void GroundField::add_plane(const GroundPlane& plane) {
  planes_.push_back(plane);
}

void GroundField::add_box(const GroundBox& box) {
  boxes_.push_back(box);
}

void GroundField::add_flat(float height, uint32_t layer) {
  GroundPlane plane;
  plane.normal = up_axis();
  plane.distance = height;
  plane.layer = layer;
  planes_.push_back(plane);
}

void GroundField::add_ramp(float min_x, float max_x, float z0, float z1, float base_height,
                           float rise_deg, uint32_t layer) {
  const float angle = deg_to_rad(rise_deg);
  GroundPlane plane;
  plane.normal = vec3_normalize({0.0f, std::cos(angle), -std::sin(angle)});
  plane.distance = vec3_dot(plane.normal, {0.0f, base_height, z0});
  plane.bounded = true;
  plane.min_x = std::min(min_x, max_x);
  plane.max_x = std::max(min_x, max_x);
  plane.min_z = std::min(z0, z1);
  plane.max_z = std::max(z0, z1);
  plane.layer = layer;
  planes_.push_back(plane);
}

void GroundField::add_stairs(float min_x, float max_x, float z0, float step_depth, float step_rise,
                             int steps, uint32_t layer) {
  const float cx = 0.5f * (min_x + max_x);
  const float hx = 0.5f * std::abs(max_x - min_x);
  for (int i = 0; i < steps; ++i) {
    const float top = step_rise * static_cast<float>(i + 1);
    GroundBox box;
    box.center = {cx, 0.5f * top, z0 + step_depth * (static_cast<float>(i) + 0.5f)};
    box.half_extents = {hx, 0.5f * top, 0.5f * step_depth};
    box.layer = layer;
    boxes_.push_back(box);
  }
}

void GroundField::clear() {
  planes_.clear();
  boxes_.clear();
}

GroundHit GroundField::cast_down(const Vec3& from, const Vec3& to, uint32_t collision_mask) const {
  ++query_count_;
  GroundHit best{};
  const Vec3 seg = vec3_sub(to, from);
  const float max_t = vec3_length(seg);
  if (max_t < kEps) return best;
  const Vec3 dir = vec3_mul(seg, 1.0f / max_t);

  float best_t = max_t;
  for (const auto& plane : planes_) {
    if ((plane.layer & collision_mask) == 0) continue;
    SegmentHit hit{};
    if (segment_plane(from, dir, best_t, plane, hit) && hit.t <= best_t) {
      best.hit = true;
      best_t = hit.t;
      best.normal = hit.normal;
      best.position = vec3_add(from, vec3_mul(dir, hit.t));
    }
  }
  for (const auto& box : boxes_) {
    if ((box.layer & collision_mask) == 0) continue;
    SegmentHit hit{};
    if (segment_aabb(from, dir, box.center, box.half_extents, best_t, hit) && hit.t <= best_t) {
      best.hit = true;
      best_t = hit.t;
      best.normal = hit.normal;
      best.position = vec3_add(from, vec3_mul(dir, hit.t));
    }
  }
  return best;
}

KinematicBody::KinematicBody(const GroundQueryProvider* ground, const Vec3& start,
                             uint32_t collision_mask)
    : ground_(ground), collision_mask_(collision_mask) {
  state_.position = start;
  state_.basis = basis_from_yaw(0.0f);
  snap_to_ground();
}

void KinematicBody::set_keyframes(std::vector<BodyKeyframe> keys) {
  keys_ = std::move(keys);
  std::stable_sort(keys_.begin(), keys_.end(),
                   [](const BodyKeyframe& a, const BodyKeyframe& b) { return a.time < b.time; });
}

void KinematicBody::set_velocity(const Vec3& velocity) {
  state_.velocity = vec3_horizontal(velocity);
}

void KinematicBody::set_yaw(float yaw) {
  yaw_ = yaw;
  state_.basis = basis_from_yaw(yaw_);
}

void KinematicBody::step(float dt) {
  if (!keys_.empty()) {
    const BodyKeyframe* active = nullptr;
    for (const auto& key : keys_) {
      if (key.time <= time_ + kEps) active = &key;
    }
    if (active) {
      set_velocity(active->velocity);
      set_yaw(active->yaw);
    }
  }
  state_.position = vec3_add(state_.position, vec3_mul(state_.velocity, dt));
  time_ += dt;
  snap_to_ground();
}

void KinematicBody::snap_to_ground() {
  if (!ground_) {
    state_.on_ground = false;
    state_.floor_normal = up_axis();
    return;
  }
  const Vec3 from = vec3_add(state_.position, vec3_mul(up_axis(), probe_up_));
  const Vec3 to = vec3_sub(state_.position, vec3_mul(up_axis(), probe_down_));
  const GroundHit hit = ground_->cast_down(from, to, collision_mask_);
  state_.on_ground = hit.hit;
  if (hit.hit) {
    state_.position.y = hit.position.y;
    state_.floor_normal = hit.normal;
  } else {
    state_.floor_normal = up_axis();
  }
}

} // namespace lcm
