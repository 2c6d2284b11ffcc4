#include "lcm/math.h"

#include <algorithm>

namespace lcm {

Vec3 vec3_sub(const Vec3& a, const Vec3& b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}

Vec3 vec3_add(const Vec3& a, const Vec3& b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}

Vec3 vec3_mul(const Vec3& a, float s) {
  return {a.x * s, a.y * s, a.z * s};
}

float vec3_dot(const Vec3& a, const Vec3& b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

Vec3 vec3_cross(const Vec3& a, const Vec3& b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

float vec3_length_sq(const Vec3& v) {
  return vec3_dot(v, v);
}

float vec3_length(const Vec3& v) {
  return std::sqrt(vec3_length_sq(v));
}

Vec3 vec3_normalize(const Vec3& v) {
  const float len = vec3_length(v);
  if (len <= kEps) {
    return {0.0f, 0.0f, 0.0f};
  }
  const float inv = 1.0f / len;
  return {v.x * inv, v.y * inv, v.z * inv};
}

Vec3 vec3_lerp(const Vec3& a, const Vec3& b, float t) {
  return vec3_add(a, vec3_mul(vec3_sub(b, a), t));
}

Vec3 vec3_horizontal(const Vec3& v) {
  return {v.x, 0.0f, v.z};
}

float vec3_distance(const Vec3& a, const Vec3& b) {
  return vec3_length(vec3_sub(a, b));
}

Vec3 vec3_clamp_length(const Vec3& v, float max_len) {
  const float len = vec3_length(v);
  if (len <= max_len || len <= kEps) {
    return v;
  }
  return vec3_mul(v, max_len / len);
}

Vec2 vec3_to_xz(const Vec3& v) {
  return {v.x, v.z};
}

Vec3 up_axis() {
  return {0.0f, 1.0f, 0.0f};
}

float clampf(float v, float lo, float hi) {
  return std::max(lo, std::min(hi, v));
}

float saturate(float v) {
  return clampf(v, 0.0f, 1.0f);
}

float deg_to_rad(float deg) {
  return deg * kPi / 180.0f;
}

float rad_to_deg(float rad) {
  return rad * 180.0f / kPi;
}

float angle_between_deg(const Vec3& a, const Vec3& b) {
  const Vec3 na = vec3_normalize(a);
  const Vec3 nb = vec3_normalize(b);
  if (vec3_length_sq(na) < 0.5f || vec3_length_sq(nb) < 0.5f) {
    return 0.0f;
  }
  return rad_to_deg(std::acos(clampf(vec3_dot(na, nb), -1.0f, 1.0f)));
}

Basis basis_from_yaw(float yaw) {
  Basis out;
  out.forward = {std::sin(yaw), 0.0f, std::cos(yaw)};
  out.right = {std::cos(yaw), 0.0f, -std::sin(yaw)};
  out.up = up_axis();
  return out;
}

Basis basis_from_up_forward(const Vec3& up, const Vec3& forward) {
  Basis out;
  out.up = vec3_normalize(up);
  if (vec3_length_sq(out.up) < 0.5f) {
    out.up = up_axis();
  }
  Vec3 right = vec3_cross(out.up, forward);
  if (vec3_length(right) < 0.0001f) {
    right = vec3_cross(out.up, {0.0f, 0.0f, 1.0f});
    if (vec3_length(right) < 0.0001f) {
      right = vec3_cross(out.up, {1.0f, 0.0f, 0.0f});
    }
  }
  out.right = vec3_normalize(right);
  out.forward = vec3_normalize(vec3_cross(out.right, out.up));
  return out;
}

Vec3 basis_to_world(const Basis& basis, const Vec3& local) {
  return vec3_add(vec3_add(vec3_mul(basis.right, local.x), vec3_mul(basis.up, local.y)),
                  vec3_mul(basis.forward, local.z));
}

Vec3 basis_to_local(const Basis& basis, const Vec3& world_dir) {
  return {vec3_dot(world_dir, basis.right), vec3_dot(world_dir, basis.up),
          vec3_dot(world_dir, basis.forward)};
}

} // namespace lcm
