#pragma once

#include "armgen/error.h"
#include "armgen/frame.h"
#include "armgen/math.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace armgen {

struct Bone {
  std::string name;
  std::string parent;  // empty for roots
  Vec3 head{};
  Vec3 tail{0.0, 0.0, 0.1};
};

class Skeleton {
 public:
  // `bones` is a list of {bone, head, tail, parent, mirror}. A mirrored bone
  // copies its source with X negated; a missing mirror source is a warning.
  static bool from_json(const nlohmann::json& bones,
                        double degenerate_epsilon,
                        Skeleton& out,
                        std::vector<Warning>& warnings,
                        Error& error);

  // Starts from the named preset (`humanoid_basic_v1` when neither argument
  // is given) and applies `bones` as overrides: an entry naming a preset bone
  // replaces the head, tail or parent it carries, any other entry adds a bone.
  // Without a preset, a non-empty `bones` list is the whole skeleton.
  static bool from_params(const nlohmann::json& preset,
                          const nlohmann::json& bones,
                          double degenerate_epsilon,
                          Skeleton& out,
                          std::vector<Warning>& warnings,
                          Error& error);

  bool add_bone(const Bone& bone, double degenerate_epsilon, Error& error);

  const Bone* find(const std::string& name) const;
  const BoneFrame* frame(const std::string& name) const;
  bool contains(const std::string& name) const { return index_by_name_.count(name) > 0; }

  const std::vector<Bone>& bones() const { return bones_; }
  const std::vector<BoneFrame>& frames() const { return frames_; }

 private:
  static bool build(const std::vector<Bone>& base,
                    const nlohmann::json& bones,
                    double degenerate_epsilon,
                    Skeleton& out,
                    std::vector<Warning>& warnings,
                    Error& error);

  std::vector<Bone> bones_;
  std::vector<BoneFrame> frames_;
  std::map<std::string, size_t> index_by_name_;
};

// _l <-> _r, _L <-> _R as suffix, then _l_ <-> _r_, _L_ <-> _R_ as infix.
// Names without a side marker are returned unchanged.
std::string mirror_bone_name(const std::string& name);

} // namespace armgen
