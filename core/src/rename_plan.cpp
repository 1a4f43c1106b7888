#include "armgen/rename_plan.h"

#include <utility>

namespace armgen::groups {

namespace {

std::string join_names(const std::vector<std::string>& names) {
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out += ", ";
    out += "'" + names[i] + "'";
  }
  return out;
}

std::map<std::string, std::vector<std::string>> sources_by_destination(const NameMapping& mapping) {
  std::map<std::string, std::vector<std::string>> out;
  for (const auto& [src, dst] : mapping) {
    if (src == dst) continue;
    out[dst].push_back(src);
  }
  return out;
}

std::string unique_temp_name(const std::string& prefix,
                             const std::string& src,
                             const NameSet& taken) {
  const std::string base = prefix + src;
  if (taken.count(base) == 0) {
    return base;
  }
  for (size_t n = 1;; ++n) {
    std::string candidate = base + "_" + std::to_string(n);
    if (taken.count(candidate) == 0) {
      return candidate;
    }
  }
}

} // namespace

bool plan_renames(const NameMapping& mapping,
                  const NameSet& existing,
                  const std::string& temp_prefix,
                  RenamePlan& out,
                  Error& error) {
  out.clear();

  NameMapping pending;
  for (const auto& [src, dst] : mapping) {
    if (src != dst) {
      pending.emplace(src, dst);
    }
  }
  if (pending.empty()) {
    return true;
  }

  std::vector<std::string> missing;
  for (const auto& entry : pending) {
    if (existing.count(entry.first) == 0) missing.push_back(entry.first);
  }
  if (!missing.empty()) {
    return fail(error, ErrorKind::MissingTarget,
                "vertex groups to rename do not exist: " + join_names(missing));
  }

  std::vector<std::string> collisions;
  for (const auto& [dst, srcs] : sources_by_destination(pending)) {
    if (srcs.size() > 1) collisions.push_back(dst);
  }
  if (!collisions.empty()) {
    return fail(error, ErrorKind::Collision,
                "several vertex groups map onto " + join_names(collisions) +
                    "; resolve these as merges before renaming");
  }

  std::vector<std::string> conflicts;
  for (const auto& entry : pending) {
    const std::string& dst = entry.second;
    if (existing.count(dst) > 0 && pending.count(dst) == 0) conflicts.push_back(dst);
  }
  if (!conflicts.empty()) {
    return fail(error, ErrorKind::Conflict,
                "rename destinations already exist: " + join_names(conflicts));
  }

  NameSet taken = existing;
  for (const auto& entry : pending) {
    taken.insert(entry.second);
  }

  // Any source whose destination is also a source moves aside first.
  NameMapping remaining;
  for (const auto& [src, dst] : pending) {
    if (pending.count(dst) == 0) {
      remaining.emplace(src, dst);
      continue;
    }
    const std::string temp = unique_temp_name(temp_prefix, src, taken);
    taken.insert(temp);
    out.push_back({src, temp});
    remaining.emplace(temp, dst);
  }

  while (!remaining.empty()) {
    bool progressed = false;
    for (auto it = remaining.begin(); it != remaining.end();) {
      if (remaining.count(it->second) > 0) {
        ++it;
        continue;
      }
      out.push_back({it->first, it->second});
      it = remaining.erase(it);
      progressed = true;
    }
    if (!progressed) {
      std::vector<std::string> stuck;
      for (const auto& entry : remaining) stuck.push_back(entry.first);
      out.clear();
      return fail(error, ErrorKind::Internal,
                  "rename plan made no progress; unresolved cycle through " + join_names(stuck));
    }
  }
  return true;
}

bool apply_rename_plan(NameSet& names, const RenamePlan& plan, Error& error) {
  for (size_t i = 0; i < plan.size(); ++i) {
    const RenameStep& step = plan[i];
    const std::string where = "step " + std::to_string(i);
    if (names.count(step.src) == 0) {
      return fail(error, ErrorKind::MissingTarget, "source '" + step.src + "' is not present", where);
    }
    if (names.count(step.dst) > 0) {
      return fail(error, ErrorKind::Conflict, "destination '" + step.dst + "' is already present", where);
    }
    names.erase(step.src);
    names.insert(step.dst);
  }
  return true;
}

bool plan_group_mapping(const NameMapping& mapping,
                        const NameSet& existing,
                        const std::string& temp_prefix,
                        GroupPlan& out,
                        Error& error) {
  out = GroupPlan{};

  NameMapping renames;
  for (const auto& [dst, srcs] : sources_by_destination(mapping)) {
    const bool dst_is_source = mapping.count(dst) > 0 && mapping.at(dst) != dst;
    if (srcs.size() > 1 && !dst_is_source) {
      for (const auto& src : srcs) {
        if (existing.count(src) == 0) {
          return fail(error, ErrorKind::MissingTarget, "vertex group to merge does not exist: '" + src + "'");
        }
        out.merges.push_back({src, dst});
      }
      continue;
    }
    for (const auto& src : srcs) {
      renames.emplace(src, dst);
    }
  }

  // Merged sources disappear and merge destinations appear before renaming.
  NameSet after_merge = existing;
  for (const auto& merge : out.merges) {
    after_merge.erase(merge.src);
    after_merge.insert(merge.dst);
  }
  return plan_renames(renames, after_merge, temp_prefix, out.renames, error);
}

} // namespace armgen::groups
