#pragma once

#include "armgen/error.h"
#include "armgen/math.h"

#include <optional>
#include <string>

namespace armgen {

constexpr double kDegenerateEpsilon = 1e-6;

// Local frame of one bone. The orientation maps local +Z onto the bone axis,
// keeping local +Y as close to world +Y as the axis allows.
struct BoneFrame {
  std::string name;
  Vec3 head{};
  Vec3 tail{};
  Vec3 axis{0.0, 0.0, 1.0};
  double length = 0.0;
  Quat orientation{};
};

bool compute_bone_frame(const std::string& name,
                        const Vec3& head,
                        const Vec3& tail,
                        double epsilon,
                        BoneFrame& out,
                        Error& error);

Quat orientation_for_axis(const Vec3& unit_axis);

// head + orientation * (relative * length)
Vec3 bone_relative_point(const BoneFrame& frame, const Vec3& relative);

// orientation * euler(degrees), base then override.
Quat bone_relative_rotation(const BoneFrame& frame, const std::optional<Vec3>& rotation_deg);

Transform place_relative(const BoneFrame& frame,
                         const Vec3& offset,
                         const std::optional<Vec3>& rotation_deg,
                         const Vec3& scale);

Transform place_absolute(const Vec3& position,
                         const std::optional<Vec3>& rotation_deg,
                         const Vec3& scale);

} // namespace armgen
