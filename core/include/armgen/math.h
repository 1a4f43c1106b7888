#pragma once

#include <cmath>

namespace armgen {

constexpr double kPi = 3.14159265358979323846;

struct Vec3 {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

// Unit quaternion, w first.
struct Quat {
  double w = 1.0;
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

// Column-major, translation in m[12..14].
struct Mat4 {
  double m[16];
};

struct Transform {
  Vec3 position{};
  Quat rotation{};
  Vec3 scale{1.0, 1.0, 1.0};
};

inline double deg_to_rad(double deg) {
  return deg * kPi / 180.0;
}

Vec3 vec3_sub(const Vec3& a, const Vec3& b);
Vec3 vec3_add(const Vec3& a, const Vec3& b);
Vec3 vec3_mul(const Vec3& a, double s);
Vec3 vec3_hadamard(const Vec3& a, const Vec3& b);
double vec3_dot(const Vec3& a, const Vec3& b);
Vec3 vec3_cross(const Vec3& a, const Vec3& b);
double vec3_length(const Vec3& v);
Vec3 vec3_normalize(const Vec3& v);
bool vec3_is_finite(const Vec3& v);

Quat quat_identity();
Quat quat_mul(const Quat& a, const Quat& b);
Quat quat_normalize(const Quat& q);
Quat quat_from_axis_angle(const Vec3& axis, double radians);
// Blender XYZ euler order: X applied first, then Y, then Z.
Quat quat_from_euler_xyz(const Vec3& radians);
// Columns are the images of the local X, Y and Z axes.
Quat quat_from_basis(const Vec3& x_axis, const Vec3& y_axis, const Vec3& z_axis);
Vec3 quat_rotate(const Quat& q, const Vec3& v);

Mat4 mat4_identity();
Mat4 mat4_mul(const Mat4& a, const Mat4& b);
Mat4 mat4_translation(const Vec3& t);
Mat4 mat4_scale(const Vec3& s);
Mat4 mat4_rotation(const Quat& q);
// translation * rotation * scale
Mat4 mat4_from_transform(const Transform& t);
Vec3 mat4_transform_point(const Mat4& m, const Vec3& p);

} // namespace armgen
