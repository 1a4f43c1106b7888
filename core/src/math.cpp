#include "armgen/math.h"

namespace armgen {

Vec3 vec3_sub(const Vec3& a, const Vec3& b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}

Vec3 vec3_add(const Vec3& a, const Vec3& b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}

Vec3 vec3_mul(const Vec3& a, double s) {
  return {a.x * s, a.y * s, a.z * s};
}

Vec3 vec3_hadamard(const Vec3& a, const Vec3& b) {
  return {a.x * b.x, a.y * b.y, a.z * b.z};
}

double vec3_dot(const Vec3& a, const Vec3& b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

Vec3 vec3_cross(const Vec3& a, const Vec3& b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

double vec3_length(const Vec3& v) {
  return std::sqrt(vec3_dot(v, v));
}

Vec3 vec3_normalize(const Vec3& v) {
  const double len = vec3_length(v);
  if (len <= 1e-12) {
    return {0.0, 0.0, 0.0};
  }
  const double inv = 1.0 / len;
  return {v.x * inv, v.y * inv, v.z * inv};
}

bool vec3_is_finite(const Vec3& v) {
  return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

Quat quat_identity() {
  return Quat{};
}

Quat quat_mul(const Quat& a, const Quat& b) {
  return {a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z,
          a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y,
          a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x,
          a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w};
}

Quat quat_normalize(const Quat& q) {
  const double len = std::sqrt(q.w * q.w + q.x * q.x + q.y * q.y + q.z * q.z);
  if (len <= 1e-12) {
    return quat_identity();
  }
  const double inv = 1.0 / len;
  return {q.w * inv, q.x * inv, q.y * inv, q.z * inv};
}

Quat quat_from_axis_angle(const Vec3& axis, double radians) {
  const Vec3 n = vec3_normalize(axis);
  const double half = radians * 0.5;
  const double s = std::sin(half);
  return {std::cos(half), n.x * s, n.y * s, n.z * s};
}

Quat quat_from_euler_xyz(const Vec3& r) {
  const Quat qx = quat_from_axis_angle({1.0, 0.0, 0.0}, r.x);
  const Quat qy = quat_from_axis_angle({0.0, 1.0, 0.0}, r.y);
  const Quat qz = quat_from_axis_angle({0.0, 0.0, 1.0}, r.z);
  return quat_mul(qz, quat_mul(qy, qx));
}

Quat quat_from_basis(const Vec3& c0, const Vec3& c1, const Vec3& c2) {
  // r<row><col>
  const double r00 = c0.x, r10 = c0.y, r20 = c0.z;
  const double r01 = c1.x, r11 = c1.y, r21 = c1.z;
  const double r02 = c2.x, r12 = c2.y, r22 = c2.z;

  Quat out;
  const double trace = r00 + r11 + r22;
  if (trace > 0.0) {
    const double s = std::sqrt(trace + 1.0) * 2.0;
    out.w = 0.25 * s;
    out.x = (r21 - r12) / s;
    out.y = (r02 - r20) / s;
    out.z = (r10 - r01) / s;
  } else if (r00 > r11 && r00 > r22) {
    const double s = std::sqrt(1.0 + r00 - r11 - r22) * 2.0;
    out.w = (r21 - r12) / s;
    out.x = 0.25 * s;
    out.y = (r01 + r10) / s;
    out.z = (r02 + r20) / s;
  } else if (r11 > r22) {
    const double s = std::sqrt(1.0 + r11 - r00 - r22) * 2.0;
    out.w = (r02 - r20) / s;
    out.x = (r01 + r10) / s;
    out.y = 0.25 * s;
    out.z = (r12 + r21) / s;
  } else {
    const double s = std::sqrt(1.0 + r22 - r00 - r11) * 2.0;
    out.w = (r10 - r01) / s;
    out.x = (r02 + r20) / s;
    out.y = (r12 + r21) / s;
    out.z = 0.25 * s;
  }
  return quat_normalize(out);
}

Vec3 quat_rotate(const Quat& q, const Vec3& v) {
  // v' = v + 2w(u x v) + 2 u x (u x v)
  const Vec3 u{q.x, q.y, q.z};
  const Vec3 t = vec3_mul(vec3_cross(u, v), 2.0);
  return vec3_add(vec3_add(v, vec3_mul(t, q.w)), vec3_cross(u, t));
}

Mat4 mat4_identity() {
  Mat4 out{};
  out.m[0] = 1.0;
  out.m[5] = 1.0;
  out.m[10] = 1.0;
  out.m[15] = 1.0;
  return out;
}

Mat4 mat4_mul(const Mat4& a, const Mat4& b) {
  Mat4 out{};
  for (int col = 0; col < 4; ++col) {
    for (int row = 0; row < 4; ++row) {
      out.m[col * 4 + row] =
          a.m[0 * 4 + row] * b.m[col * 4 + 0] +
          a.m[1 * 4 + row] * b.m[col * 4 + 1] +
          a.m[2 * 4 + row] * b.m[col * 4 + 2] +
          a.m[3 * 4 + row] * b.m[col * 4 + 3];
    }
  }
  return out;
}

Mat4 mat4_translation(const Vec3& t) {
  Mat4 out = mat4_identity();
  out.m[12] = t.x;
  out.m[13] = t.y;
  out.m[14] = t.z;
  return out;
}

Mat4 mat4_scale(const Vec3& s) {
  Mat4 out = mat4_identity();
  out.m[0] = s.x;
  out.m[5] = s.y;
  out.m[10] = s.z;
  return out;
}

Mat4 mat4_rotation(const Quat& q) {
  const Vec3 cx = quat_rotate(q, {1.0, 0.0, 0.0});
  const Vec3 cy = quat_rotate(q, {0.0, 1.0, 0.0});
  const Vec3 cz = quat_rotate(q, {0.0, 0.0, 1.0});
  Mat4 out = mat4_identity();
  out.m[0] = cx.x;
  out.m[1] = cx.y;
  out.m[2] = cx.z;
  out.m[4] = cy.x;
  out.m[5] = cy.y;
  out.m[6] = cy.z;
  out.m[8] = cz.x;
  out.m[9] = cz.y;
  out.m[10] = cz.z;
  return out;
}

Mat4 mat4_from_transform(const Transform& t) {
  return mat4_mul(mat4_translation(t.position),
                  mat4_mul(mat4_rotation(t.rotation), mat4_scale(t.scale)));
}

Vec3 mat4_transform_point(const Mat4& m, const Vec3& p) {
  return {m.m[0] * p.x + m.m[4] * p.y + m.m[8] * p.z + m.m[12],
          m.m[1] * p.x + m.m[5] * p.y + m.m[9] * p.z + m.m[13],
          m.m[2] * p.x + m.m[6] * p.y + m.m[10] * p.z + m.m[14]};
}

} // namespace armgen
