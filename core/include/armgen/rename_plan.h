#pragma once

#include "armgen/error.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace armgen::groups {

using NameMapping = std::map<std::string, std::string>;
using NameSet = std::set<std::string>;

struct RenameStep {
  std::string src;
  std::string dst;
};

using RenamePlan = std::vector<RenameStep>;

constexpr const char* kDefaultTempPrefix = "__armgen_tmp_";

// Ordered renames realizing `mapping` over `existing`. When applied in order
// every step finds `src` present and `dst` absent. No-op entries are dropped;
// cycles and chains route through "<temp_prefix><src>" (with a numeric
// suffix on clashes). Rejects many-to-one mappings (Collision), sources not
// in `existing` (MissingTarget) and destinations already present that are not
// renamed away (Conflict).
bool plan_renames(const NameMapping& mapping,
                  const NameSet& existing,
                  const std::string& temp_prefix,
                  RenamePlan& out,
                  Error& error);

// Replays `plan` over `names`, failing on the first unsafe step.
bool apply_rename_plan(NameSet& names, const RenamePlan& plan, Error& error);

struct MergeStep {
  std::string src;
  std::string dst;
};

struct GroupPlan {
  std::vector<MergeStep> merges;  // applied first
  RenamePlan renames;
};

// Pulls many-to-one entries whose destination is not itself a source out as
// weight merges, then plans the remaining one-to-one renames.
bool plan_group_mapping(const NameMapping& mapping,
                        const NameSet& existing,
                        const std::string& temp_prefix,
                        GroupPlan& out,
                        Error& error);

} // namespace armgen::groups
