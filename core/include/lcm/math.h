#pragma once

#include <cmath>

namespace lcm {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kEps = 1e-5f;

struct Vec3 {
  float x;
  float y;
  float z;
};

// Horizontal (XZ) projection used by support polygons.
struct Vec2 {
  float x;
  float y;
};

struct Basis {
  Vec3 right{1.0f, 0.0f, 0.0f};
  Vec3 up{0.0f, 1.0f, 0.0f};
  Vec3 forward{0.0f, 0.0f, 1.0f};
};

Vec3 vec3_sub(const Vec3& a, const Vec3& b);
Vec3 vec3_add(const Vec3& a, const Vec3& b);
Vec3 vec3_mul(const Vec3& a, float s);
float vec3_dot(const Vec3& a, const Vec3& b);
Vec3 vec3_cross(const Vec3& a, const Vec3& b);
float vec3_length_sq(const Vec3& v);
float vec3_length(const Vec3& v);
Vec3 vec3_normalize(const Vec3& v);
Vec3 vec3_lerp(const Vec3& a, const Vec3& b, float t);
Vec3 vec3_horizontal(const Vec3& v);
float vec3_distance(const Vec3& a, const Vec3& b);
Vec3 vec3_clamp_length(const Vec3& v, float max_len);
Vec2 vec3_to_xz(const Vec3& v);
Vec3 up_axis();

float clampf(float v, float lo, float hi);
float saturate(float v);
float deg_to_rad(float deg);
float rad_to_deg(float rad);
// Angle in degrees between two directions; 0 when either is degenerate.
float angle_between_deg(const Vec3& a, const Vec3& b);

Basis basis_from_yaw(float yaw);
Basis basis_from_up_forward(const Vec3& up, const Vec3& forward);
Vec3 basis_to_world(const Basis& basis, const Vec3& local);
Vec3 basis_to_local(const Basis& basis, const Vec3& world_dir);

} // namespace lcm
