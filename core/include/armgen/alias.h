#pragma once

#include "armgen/error.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace armgen::alias {

// Sorted by key; every value is an independent copy with no `mirror` record left.
using DefinitionTable = std::map<std::string, nlohmann::json>;

bool is_alias(const nlohmann::json& record);

// `table` must be a JSON object (or null, treated as empty). Records of the
// form {"mirror": "<other key>"} are replaced by a copy of the resolved
// target. `table_name` prefixes error paths ("bone_meshes.arm_R.mirror").
bool resolve(const nlohmann::json& table,
             const std::string& table_name,
             DefinitionTable& out,
             Error& error);

// Follows `mirror` records from `key` to the key of the concrete definition.
// Meaningful once resolve() has accepted `table`.
std::string source_key(const nlohmann::json& table, const std::string& key);

} // namespace armgen::alias
