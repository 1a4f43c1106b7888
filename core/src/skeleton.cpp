#include "armgen/skeleton.h"

#include "armgen/log.h"
#include "armgen/skeleton_presets.h"
#include "armgen/validate.h"

namespace armgen {

namespace {

using json = nlohmann::json;

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

struct BoneEntry {
  Bone bone;
  std::string mirror;
  bool has_head = false;
  bool has_tail = false;
  bool has_parent = false;
};

bool parse_bone_entry(const json& value, const std::string& path, BoneEntry& out, Error& error) {
  if (!validate::check_keys(value, {"bone", "head", "tail", "parent", "mirror"}, path, error)) return false;
  if (!value.contains("bone")) {
    return fail(error, ErrorKind::Shape, "bone entry requires 'bone'", path);
  }
  if (!validate::read_string(value["bone"], validate::join_path(path, "bone"), out.bone.name, error)) return false;
  if (out.bone.name.empty()) {
    return fail(error, ErrorKind::Shape, "bone name must not be empty", validate::join_path(path, "bone"));
  }
  if (value.contains("head")) {
    if (!validate::read_vec3(value["head"], validate::join_path(path, "head"), out.bone.head, error)) return false;
    out.has_head = true;
  }
  if (value.contains("tail")) {
    if (!validate::read_vec3(value["tail"], validate::join_path(path, "tail"), out.bone.tail, error)) return false;
    out.has_tail = true;
  }
  if (value.contains("parent") && !value["parent"].is_null()) {
    if (!validate::read_string(value["parent"], validate::join_path(path, "parent"), out.bone.parent, error)) {
      return false;
    }
    out.has_parent = true;
  }
  if (value.contains("mirror") && !value["mirror"].is_null()) {
    if (!validate::read_string(value["mirror"], validate::join_path(path, "mirror"), out.mirror, error)) {
      return false;
    }
  }
  return true;
}

} // namespace

std::string mirror_bone_name(const std::string& name) {
  if (ends_with(name, "_l")) return name.substr(0, name.size() - 2) + "_r";
  if (ends_with(name, "_L")) return name.substr(0, name.size() - 2) + "_R";
  if (ends_with(name, "_r")) return name.substr(0, name.size() - 2) + "_l";
  if (ends_with(name, "_R")) return name.substr(0, name.size() - 2) + "_L";
  if (name.find("_l_") != std::string::npos) return replace_all(name, "_l_", "_r_");
  if (name.find("_L_") != std::string::npos) return replace_all(name, "_L_", "_R_");
  if (name.find("_r_") != std::string::npos) return replace_all(name, "_r_", "_l_");
  if (name.find("_R_") != std::string::npos) return replace_all(name, "_R_", "_L_");
  return name;
}

bool Skeleton::add_bone(const Bone& bone, double degenerate_epsilon, Error& error) {
  if (contains(bone.name)) {
    return fail(error, ErrorKind::Shape, "duplicate bone '" + bone.name + "'",
                validate::join_path("skeleton", bone.name));
  }
  BoneFrame frame;
  if (!compute_bone_frame(bone.name, bone.head, bone.tail, degenerate_epsilon, frame, error)) return false;
  index_by_name_[bone.name] = bones_.size();
  bones_.push_back(bone);
  frames_.push_back(std::move(frame));
  return true;
}

const Bone* Skeleton::find(const std::string& name) const {
  auto it = index_by_name_.find(name);
  if (it == index_by_name_.end()) return nullptr;
  return &bones_[it->second];
}

const BoneFrame* Skeleton::frame(const std::string& name) const {
  auto it = index_by_name_.find(name);
  if (it == index_by_name_.end()) return nullptr;
  return &frames_[it->second];
}

bool Skeleton::from_json(const json& bones,
                         double degenerate_epsilon,
                         Skeleton& out,
                         std::vector<Warning>& warnings,
                         Error& error) {
  return build(std::vector<Bone>{}, bones, degenerate_epsilon, out, warnings, error);
}

bool Skeleton::from_params(const json& preset,
                           const json& bones,
                           double degenerate_epsilon,
                           Skeleton& out,
                           std::vector<Warning>& warnings,
                           Error& error) {
  const bool has_preset = !preset.is_null();
  const bool has_bones = !bones.is_null() && !(bones.is_array() && bones.empty());
  if (!has_preset && has_bones) {
    return from_json(bones, degenerate_epsilon, out, warnings, error);
  }

  std::string name = kDefaultSkeletonPreset;
  if (has_preset) {
    if (!validate::read_string(preset, "skeleton_preset", name, error)) return false;
  } else {
    log::info(std::string("no skeleton given, using preset ") + kDefaultSkeletonPreset);
  }
  std::vector<Bone> base;
  if (!skeleton_preset_bones(name, base)) {
    std::string known;
    for (const auto& preset_name : skeleton_preset_names()) {
      known += known.empty() ? preset_name : ", " + preset_name;
    }
    return fail(error, ErrorKind::Shape, "unknown skeleton preset '" + name + "' (known: " + known + ")",
                "skeleton_preset");
  }
  return build(base, bones.is_null() ? json::array() : bones, degenerate_epsilon, out, warnings, error);
}

bool Skeleton::build(const std::vector<Bone>& base,
                     const json& bones,
                     double degenerate_epsilon,
                     Skeleton& out,
                     std::vector<Warning>& warnings,
                     Error& error) {
  if (!bones.is_array()) {
    return fail(error, ErrorKind::Shape, std::string("skeleton must be a list, got ") + validate::type_name(bones),
                "skeleton");
  }

  std::vector<BoneEntry> plain;
  std::vector<BoneEntry> mirrored;
  for (size_t i = 0; i < bones.size(); ++i) {
    BoneEntry entry;
    if (!parse_bone_entry(bones[i], validate::index_path("skeleton", i), entry, error)) return false;
    if (entry.mirror.empty()) {
      plain.push_back(std::move(entry));
    } else {
      mirrored.push_back(std::move(entry));
    }
  }

  // Entries naming a base bone override only the fields they carry.
  std::vector<Bone> merged = base;
  std::map<std::string, size_t> merged_index;
  for (size_t i = 0; i < merged.size(); ++i) merged_index[merged[i].name] = i;
  for (const auto& entry : plain) {
    auto it = merged_index.find(entry.bone.name);
    if (it == merged_index.end()) {
      merged_index[entry.bone.name] = merged.size();
      merged.push_back(entry.bone);
      continue;
    }
    if (it->second >= base.size()) {
      return fail(error, ErrorKind::Shape, "duplicate bone '" + entry.bone.name + "'",
                  validate::join_path("skeleton", entry.bone.name));
    }
    Bone& bone = merged[it->second];
    if (entry.has_head) bone.head = entry.bone.head;
    if (entry.has_tail) bone.tail = entry.bone.tail;
    if (entry.has_parent) bone.parent = entry.bone.parent;
  }

  Skeleton skeleton;
  for (const auto& bone : merged) {
    if (!skeleton.add_bone(bone, degenerate_epsilon, error)) return false;
  }
  for (const auto& bone : merged) {
    if (!bone.parent.empty() && !skeleton.contains(bone.parent)) {
      warnings.push_back({bone.name, "parent '" + bone.parent + "' not found"});
      log::warn("bone '" + bone.name + "': parent '" + bone.parent + "' not found");
      skeleton.bones_[skeleton.index_by_name_[bone.name]].parent.clear();
    }
  }

  for (const auto& entry : mirrored) {
    const Bone* source = skeleton.find(entry.mirror);
    if (!source) {
      warnings.push_back({entry.bone.name, "mirror source '" + entry.mirror + "' not found"});
      log::warn("bone '" + entry.bone.name + "': mirror source '" + entry.mirror + "' not found");
      continue;
    }
    Bone bone;
    bone.name = entry.bone.name;
    bone.head = {-source->head.x, source->head.y, source->head.z};
    bone.tail = {-source->tail.x, source->tail.y, source->tail.z};
    if (!source->parent.empty()) {
      const std::string mirrored_parent = mirror_bone_name(source->parent);
      bone.parent = skeleton.contains(mirrored_parent) ? mirrored_parent : source->parent;
    }
    if (!skeleton.add_bone(bone, degenerate_epsilon, error)) return false;
  }

  out = std::move(skeleton);
  return true;
}

} // namespace armgen
