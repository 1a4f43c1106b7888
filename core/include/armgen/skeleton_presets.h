#pragma once

#include "armgen/skeleton.h"

#include <string>
#include <vector>

namespace armgen {

// Used when a character names neither a preset nor a custom skeleton.
inline constexpr const char* kDefaultSkeletonPreset = "humanoid_basic_v1";

// Bones of a built-in preset, parents before children. False for unknown names.
bool skeleton_preset_bones(const std::string& name, std::vector<Bone>& out);

std::vector<std::string> skeleton_preset_names();

} // namespace armgen
