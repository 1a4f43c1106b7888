#include "armgen/alias.h"

#include "armgen/validate.h"

#include <algorithm>
#include <set>
#include <vector>

namespace armgen::alias {

namespace {

using json = nlohmann::json;

struct ResolveState {
  const json& table;
  const std::string& table_name;
  std::vector<std::string> stack;
  std::set<std::string> visiting;
  DefinitionTable resolved;
};

std::string cycle_text(const std::vector<std::string>& stack, const std::string& repeat) {
  std::string out;
  bool in_cycle = false;
  for (const auto& key : stack) {
    if (key == repeat) in_cycle = true;
    if (!in_cycle) continue;
    out += key + " -> ";
  }
  return out + repeat;
}

bool alias_target(const json& record, const std::string& path, std::string& target, Error& error) {
  if (record.size() != 1) {
    return fail(error, ErrorKind::Shape, "a 'mirror' record must not carry other fields", path);
  }
  return validate::read_string(record["mirror"], validate::join_path(path, "mirror"), target, error);
}

bool resolve_key(ResolveState& state, const std::string& key, Error& error) {
  if (state.resolved.count(key) > 0) {
    return true;
  }
  const std::string path = validate::join_path(state.table_name, key);
  if (state.visiting.count(key) > 0) {
    return fail(error, ErrorKind::Cycle,
                "mirror cycle detected at '" + key + "': " + cycle_text(state.stack, key), path);
  }

  const json& record = state.table.at(key);
  if (!is_alias(record)) {
    state.resolved.emplace(key, record);
    return true;
  }

  std::string target;
  if (!alias_target(record, path, target, error)) return false;
  if (!state.table.contains(target)) {
    return fail(error, ErrorKind::MissingTarget,
                "'" + key + "' mirrors missing key '" + target + "'",
                validate::join_path(path, "mirror"));
  }

  state.visiting.insert(key);
  state.stack.push_back(key);
  if (!resolve_key(state, target, error)) return false;
  state.stack.pop_back();
  state.visiting.erase(key);

  // json copies are deep; the entries never share storage.
  state.resolved.emplace(key, state.resolved.at(target));
  return true;
}

} // namespace

bool is_alias(const json& record) {
  return record.is_object() && record.contains("mirror");
}

bool resolve(const json& table, const std::string& table_name, DefinitionTable& out, Error& error) {
  out.clear();
  if (table.is_null()) {
    return true;
  }
  if (!validate::require_object(table, table_name, error)) return false;

  ResolveState state{table, table_name, {}, {}, {}};
  std::vector<std::string> keys;
  keys.reserve(table.size());
  for (auto it = table.begin(); it != table.end(); ++it) {
    keys.push_back(it.key());
  }
  std::sort(keys.begin(), keys.end());

  for (const auto& key : keys) {
    if (!resolve_key(state, key, error)) return false;
  }
  out = std::move(state.resolved);
  return true;
}

std::string source_key(const json& table, const std::string& key) {
  std::string current = key;
  for (size_t hops = 0; hops <= table.size(); ++hops) {
    const auto it = table.find(current);
    if (it == table.end() || !is_alias(*it) || !(*it)["mirror"].is_string()) break;
    current = (*it)["mirror"].get<std::string>();
  }
  return current;
}

} // namespace armgen::alias
