#include "armgen/frame.h"

#include "armgen/validate.h"

#include <cmath>
#include <sstream>

namespace armgen {

namespace {
Quat euler_degrees(const std::optional<Vec3>& rotation_deg) {
  if (!rotation_deg.has_value()) {
    return quat_identity();
  }
  const Vec3& r = *rotation_deg;
  return quat_from_euler_xyz({deg_to_rad(r.x), deg_to_rad(r.y), deg_to_rad(r.z)});
}
} // namespace

Quat orientation_for_axis(const Vec3& z) {
  Vec3 up{0.0, 1.0, 0.0};
  if (std::fabs(vec3_dot(z, up)) > 1.0 - 1e-6) {
    // Bone runs along world Y; fall back to world Z as the up hint.
    up = {0.0, 0.0, z.y > 0.0 ? -1.0 : 1.0};
  }
  const Vec3 x = vec3_normalize(vec3_cross(up, z));
  const Vec3 y = vec3_cross(z, x);
  return quat_from_basis(x, y, z);
}

bool compute_bone_frame(const std::string& name,
                        const Vec3& head,
                        const Vec3& tail,
                        double epsilon,
                        BoneFrame& out,
                        Error& error) {
  const std::string path = validate::join_path("skeleton", name);
  if (!vec3_is_finite(head) || !vec3_is_finite(tail)) {
    return fail(error, ErrorKind::Range, "bone head/tail must be finite", path);
  }
  const Vec3 delta = vec3_sub(tail, head);
  const double length = vec3_length(delta);
  if (!(length >= epsilon)) {
    std::ostringstream oss;
    oss << "degenerate bone '" << name << "': length " << length << " is below " << epsilon;
    return fail(error, ErrorKind::Range, oss.str(), path);
  }

  BoneFrame frame;
  frame.name = name;
  frame.head = head;
  frame.tail = tail;
  frame.length = length;
  frame.axis = vec3_mul(delta, 1.0 / length);
  frame.orientation = orientation_for_axis(frame.axis);
  out = std::move(frame);
  return true;
}

Vec3 bone_relative_point(const BoneFrame& frame, const Vec3& relative) {
  return vec3_add(frame.head, quat_rotate(frame.orientation, vec3_mul(relative, frame.length)));
}

Quat bone_relative_rotation(const BoneFrame& frame, const std::optional<Vec3>& rotation_deg) {
  return quat_normalize(quat_mul(frame.orientation, euler_degrees(rotation_deg)));
}

Transform place_relative(const BoneFrame& frame,
                         const Vec3& offset,
                         const std::optional<Vec3>& rotation_deg,
                         const Vec3& scale) {
  Transform out;
  out.position = bone_relative_point(frame, offset);
  out.rotation = bone_relative_rotation(frame, rotation_deg);
  out.scale = scale;
  return out;
}

Transform place_absolute(const Vec3& position,
                         const std::optional<Vec3>& rotation_deg,
                         const Vec3& scale) {
  Transform out;
  out.position = position;
  out.rotation = quat_normalize(euler_degrees(rotation_deg));
  out.scale = scale;
  return out;
}

} // namespace armgen
