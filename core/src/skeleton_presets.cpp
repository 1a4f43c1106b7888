#include "armgen/skeleton_presets.h"

namespace armgen {

namespace {

struct PresetBone {
  const char* name;
  double head[3];
  double tail[3];
  const char* parent;
};

constexpr PresetBone kHumanoidBasicV1[] = {
    {"root", {0.0, 0.0, 0.0}, {0.0, 0.0, 0.1}, ""},
    {"hips", {0.0, 0.0, 0.9}, {0.0, 0.0, 1.0}, "root"},
    {"spine", {0.0, 0.0, 1.0}, {0.0, 0.0, 1.2}, "hips"},
    {"chest", {0.0, 0.0, 1.2}, {0.0, 0.0, 1.4}, "spine"},
    {"neck", {0.0, 0.0, 1.4}, {0.0, 0.0, 1.5}, "chest"},
    {"head", {0.0, 0.0, 1.5}, {0.0, 0.0, 1.7}, "neck"},
    {"shoulder_l", {0.1, 0.0, 1.35}, {0.2, 0.0, 1.35}, "chest"},
    {"upper_arm_l", {0.2, 0.0, 1.35}, {0.45, 0.0, 1.35}, "shoulder_l"},
    {"lower_arm_l", {0.45, 0.0, 1.35}, {0.7, 0.0, 1.35}, "upper_arm_l"},
    {"hand_l", {0.7, 0.0, 1.35}, {0.8, 0.0, 1.35}, "lower_arm_l"},
    {"shoulder_r", {-0.1, 0.0, 1.35}, {-0.2, 0.0, 1.35}, "chest"},
    {"upper_arm_r", {-0.2, 0.0, 1.35}, {-0.45, 0.0, 1.35}, "shoulder_r"},
    {"lower_arm_r", {-0.45, 0.0, 1.35}, {-0.7, 0.0, 1.35}, "upper_arm_r"},
    {"hand_r", {-0.7, 0.0, 1.35}, {-0.8, 0.0, 1.35}, "lower_arm_r"},
    {"upper_leg_l", {0.1, 0.0, 0.9}, {0.1, 0.0, 0.5}, "hips"},
    {"lower_leg_l", {0.1, 0.0, 0.5}, {0.1, 0.0, 0.1}, "upper_leg_l"},
    {"foot_l", {0.1, 0.0, 0.1}, {0.1, 0.15, 0.0}, "lower_leg_l"},
    {"upper_leg_r", {-0.1, 0.0, 0.9}, {-0.1, 0.0, 0.5}, "hips"},
    {"lower_leg_r", {-0.1, 0.0, 0.5}, {-0.1, 0.0, 0.1}, "upper_leg_r"},
    {"foot_r", {-0.1, 0.0, 0.1}, {-0.1, 0.15, 0.0}, "lower_leg_r"},
};

constexpr PresetBone kHumanoidDetailedV1[] = {
    {"root", {0.0, 0.0, 0.0}, {0.0, 0.0, 0.1}, ""},
    {"hips", {0.0, 0.0, 0.9}, {0.0, 0.0, 1.0}, "root"},
    {"spine", {0.0, 0.0, 1.0}, {0.0, 0.0, 1.2}, "hips"},
    {"chest", {0.0, 0.0, 1.2}, {0.0, 0.0, 1.4}, "spine"},
    {"neck", {0.0, 0.0, 1.4}, {0.0, 0.0, 1.5}, "chest"},
    {"head", {0.0, 0.0, 1.5}, {0.0, 0.0, 1.7}, "neck"},
    {"shoulder_l", {0.1, 0.0, 1.35}, {0.2, 0.0, 1.35}, "chest"},
    {"upper_arm_l", {0.2, 0.0, 1.35}, {0.45, 0.0, 1.35}, "shoulder_l"},
    {"lower_arm_l", {0.45, 0.0, 1.35}, {0.7, 0.0, 1.35}, "upper_arm_l"},
    {"hand_l", {0.7, 0.0, 1.35}, {0.78, 0.0, 1.35}, "lower_arm_l"},
    {"thumb_01_l", {0.72, 0.02, 1.34}, {0.75, 0.04, 1.32}, "hand_l"},
    {"thumb_02_l", {0.75, 0.04, 1.32}, {0.78, 0.05, 1.3}, "thumb_01_l"},
    {"thumb_03_l", {0.78, 0.05, 1.3}, {0.8, 0.06, 1.29}, "thumb_02_l"},
    {"index_01_l", {0.78, 0.02, 1.36}, {0.82, 0.02, 1.36}, "hand_l"},
    {"index_02_l", {0.82, 0.02, 1.36}, {0.85, 0.02, 1.36}, "index_01_l"},
    {"index_03_l", {0.85, 0.02, 1.36}, {0.87, 0.02, 1.36}, "index_02_l"},
    {"middle_01_l", {0.78, 0.0, 1.35}, {0.83, 0.0, 1.35}, "hand_l"},
    {"middle_02_l", {0.83, 0.0, 1.35}, {0.87, 0.0, 1.35}, "middle_01_l"},
    {"middle_03_l", {0.87, 0.0, 1.35}, {0.89, 0.0, 1.35}, "middle_02_l"},
    {"ring_01_l", {0.78, -0.02, 1.34}, {0.82, -0.02, 1.34}, "hand_l"},
    {"ring_02_l", {0.82, -0.02, 1.34}, {0.85, -0.02, 1.34}, "ring_01_l"},
    {"ring_03_l", {0.85, -0.02, 1.34}, {0.87, -0.02, 1.34}, "ring_02_l"},
    {"pinky_01_l", {0.78, -0.04, 1.33}, {0.81, -0.04, 1.33}, "hand_l"},
    {"pinky_02_l", {0.81, -0.04, 1.33}, {0.83, -0.04, 1.33}, "pinky_01_l"},
    {"pinky_03_l", {0.83, -0.04, 1.33}, {0.85, -0.04, 1.33}, "pinky_02_l"},
    {"shoulder_r", {-0.1, 0.0, 1.35}, {-0.2, 0.0, 1.35}, "chest"},
    {"upper_arm_r", {-0.2, 0.0, 1.35}, {-0.45, 0.0, 1.35}, "shoulder_r"},
    {"lower_arm_r", {-0.45, 0.0, 1.35}, {-0.7, 0.0, 1.35}, "upper_arm_r"},
    {"hand_r", {-0.7, 0.0, 1.35}, {-0.78, 0.0, 1.35}, "lower_arm_r"},
    {"thumb_01_r", {-0.72, 0.02, 1.34}, {-0.75, 0.04, 1.32}, "hand_r"},
    {"thumb_02_r", {-0.75, 0.04, 1.32}, {-0.78, 0.05, 1.3}, "thumb_01_r"},
    {"thumb_03_r", {-0.78, 0.05, 1.3}, {-0.8, 0.06, 1.29}, "thumb_02_r"},
    {"index_01_r", {-0.78, 0.02, 1.36}, {-0.82, 0.02, 1.36}, "hand_r"},
    {"index_02_r", {-0.82, 0.02, 1.36}, {-0.85, 0.02, 1.36}, "index_01_r"},
    {"index_03_r", {-0.85, 0.02, 1.36}, {-0.87, 0.02, 1.36}, "index_02_r"},
    {"middle_01_r", {-0.78, 0.0, 1.35}, {-0.83, 0.0, 1.35}, "hand_r"},
    {"middle_02_r", {-0.83, 0.0, 1.35}, {-0.87, 0.0, 1.35}, "middle_01_r"},
    {"middle_03_r", {-0.87, 0.0, 1.35}, {-0.89, 0.0, 1.35}, "middle_02_r"},
    {"ring_01_r", {-0.78, -0.02, 1.34}, {-0.82, -0.02, 1.34}, "hand_r"},
    {"ring_02_r", {-0.82, -0.02, 1.34}, {-0.85, -0.02, 1.34}, "ring_01_r"},
    {"ring_03_r", {-0.85, -0.02, 1.34}, {-0.87, -0.02, 1.34}, "ring_02_r"},
    {"pinky_01_r", {-0.78, -0.04, 1.33}, {-0.81, -0.04, 1.33}, "hand_r"},
    {"pinky_02_r", {-0.81, -0.04, 1.33}, {-0.83, -0.04, 1.33}, "pinky_01_r"},
    {"pinky_03_r", {-0.83, -0.04, 1.33}, {-0.85, -0.04, 1.33}, "pinky_02_r"},
    {"upper_leg_l", {0.1, 0.0, 0.9}, {0.1, 0.0, 0.5}, "hips"},
    {"lower_leg_l", {0.1, 0.0, 0.5}, {0.1, 0.0, 0.1}, "upper_leg_l"},
    {"foot_l", {0.1, 0.0, 0.1}, {0.1, 0.12, 0.02}, "lower_leg_l"},
    {"toe_l", {0.1, 0.12, 0.02}, {0.1, 0.18, 0.0}, "foot_l"},
    {"upper_leg_r", {-0.1, 0.0, 0.9}, {-0.1, 0.0, 0.5}, "hips"},
    {"lower_leg_r", {-0.1, 0.0, 0.5}, {-0.1, 0.0, 0.1}, "upper_leg_r"},
    {"foot_r", {-0.1, 0.0, 0.1}, {-0.1, 0.12, 0.02}, "lower_leg_r"},
    {"toe_r", {-0.1, 0.12, 0.02}, {-0.1, 0.18, 0.0}, "foot_r"},
};

constexpr PresetBone kHumanoidGameV1[] = {
    {"root", {0.0, 0.0, 0.0}, {0.0, 0.0, 0.1}, ""},
    {"hips", {0.0, 0.0, 0.9}, {0.0, 0.0, 1.0}, "root"},
    {"spine", {0.0, 0.0, 1.0}, {0.0, 0.0, 1.2}, "hips"},
    {"chest", {0.0, 0.0, 1.2}, {0.0, 0.0, 1.4}, "spine"},
    {"neck", {0.0, 0.0, 1.4}, {0.0, 0.0, 1.5}, "chest"},
    {"head", {0.0, 0.0, 1.5}, {0.0, 0.0, 1.7}, "neck"},
    {"shoulder_l", {0.1, 0.0, 1.35}, {0.2, 0.0, 1.35}, "chest"},
    {"upper_arm_l", {0.2, 0.0, 1.35}, {0.45, 0.0, 1.35}, "shoulder_l"},
    {"upper_arm_twist_l", {0.35, 0.0, 1.35}, {0.45, 0.0, 1.35}, "upper_arm_l"},
    {"lower_arm_l", {0.45, 0.0, 1.35}, {0.7, 0.0, 1.35}, "upper_arm_l"},
    {"lower_arm_twist_l", {0.6, 0.0, 1.35}, {0.7, 0.0, 1.35}, "lower_arm_l"},
    {"hand_l", {0.7, 0.0, 1.35}, {0.78, 0.0, 1.35}, "lower_arm_l"},
    {"thumb_l", {0.72, 0.02, 1.34}, {0.78, 0.05, 1.3}, "hand_l"},
    {"index_l", {0.78, 0.02, 1.36}, {0.86, 0.02, 1.36}, "hand_l"},
    {"middle_l", {0.78, 0.0, 1.35}, {0.88, 0.0, 1.35}, "hand_l"},
    {"ring_l", {0.78, -0.02, 1.34}, {0.86, -0.02, 1.34}, "hand_l"},
    {"pinky_l", {0.78, -0.04, 1.33}, {0.84, -0.04, 1.33}, "hand_l"},
    {"shoulder_r", {-0.1, 0.0, 1.35}, {-0.2, 0.0, 1.35}, "chest"},
    {"upper_arm_r", {-0.2, 0.0, 1.35}, {-0.45, 0.0, 1.35}, "shoulder_r"},
    {"upper_arm_twist_r", {-0.35, 0.0, 1.35}, {-0.45, 0.0, 1.35}, "upper_arm_r"},
    {"lower_arm_r", {-0.45, 0.0, 1.35}, {-0.7, 0.0, 1.35}, "upper_arm_r"},
    {"lower_arm_twist_r", {-0.6, 0.0, 1.35}, {-0.7, 0.0, 1.35}, "lower_arm_r"},
    {"hand_r", {-0.7, 0.0, 1.35}, {-0.78, 0.0, 1.35}, "lower_arm_r"},
    {"thumb_r", {-0.72, 0.02, 1.34}, {-0.78, 0.05, 1.3}, "hand_r"},
    {"index_r", {-0.78, 0.02, 1.36}, {-0.86, 0.02, 1.36}, "hand_r"},
    {"middle_r", {-0.78, 0.0, 1.35}, {-0.88, 0.0, 1.35}, "hand_r"},
    {"ring_r", {-0.78, -0.02, 1.34}, {-0.86, -0.02, 1.34}, "hand_r"},
    {"pinky_r", {-0.78, -0.04, 1.33}, {-0.84, -0.04, 1.33}, "hand_r"},
    {"upper_leg_l", {0.1, 0.0, 0.9}, {0.1, 0.0, 0.5}, "hips"},
    {"upper_leg_twist_l", {0.1, 0.0, 0.65}, {0.1, 0.0, 0.5}, "upper_leg_l"},
    {"lower_leg_l", {0.1, 0.0, 0.5}, {0.1, 0.0, 0.1}, "upper_leg_l"},
    {"lower_leg_twist_l", {0.1, 0.0, 0.25}, {0.1, 0.0, 0.1}, "lower_leg_l"},
    {"foot_l", {0.1, 0.0, 0.1}, {0.1, 0.12, 0.02}, "lower_leg_l"},
    {"toe_l", {0.1, 0.12, 0.02}, {0.1, 0.18, 0.0}, "foot_l"},
    {"upper_leg_r", {-0.1, 0.0, 0.9}, {-0.1, 0.0, 0.5}, "hips"},
    {"upper_leg_twist_r", {-0.1, 0.0, 0.65}, {-0.1, 0.0, 0.5}, "upper_leg_r"},
    {"lower_leg_r", {-0.1, 0.0, 0.5}, {-0.1, 0.0, 0.1}, "upper_leg_r"},
    {"lower_leg_twist_r", {-0.1, 0.0, 0.25}, {-0.1, 0.0, 0.1}, "lower_leg_r"},
    {"foot_r", {-0.1, 0.0, 0.1}, {-0.1, 0.12, 0.02}, "lower_leg_r"},
    {"toe_r", {-0.1, 0.12, 0.02}, {-0.1, 0.18, 0.0}, "foot_r"},
};

struct Preset {
  const char* name;
  const PresetBone* bones;
  size_t count;
};

template <size_t N>
constexpr Preset make_preset(const char* name, const PresetBone (&bones)[N]) {
  return Preset{name, bones, N};
}

constexpr Preset kPresets[] = {
    make_preset("humanoid_basic_v1", kHumanoidBasicV1),
    make_preset("humanoid_detailed_v1", kHumanoidDetailedV1),
    make_preset("humanoid_game_v1", kHumanoidGameV1),
};

} // namespace

bool skeleton_preset_bones(const std::string& name, std::vector<Bone>& out) {
  for (const auto& preset : kPresets) {
    if (name != preset.name) continue;
    out.clear();
    out.reserve(preset.count);
    for (size_t i = 0; i < preset.count; ++i) {
      const PresetBone& entry = preset.bones[i];
      Bone bone;
      bone.name = entry.name;
      bone.parent = entry.parent;
      bone.head = {entry.head[0], entry.head[1], entry.head[2]};
      bone.tail = {entry.tail[0], entry.tail[1], entry.tail[2]};
      out.push_back(std::move(bone));
    }
    return true;
  }
  return false;
}

std::vector<std::string> skeleton_preset_names() {
  std::vector<std::string> names;
  for (const auto& preset : kPresets) names.emplace_back(preset.name);
  return names;
}

} // namespace armgen
