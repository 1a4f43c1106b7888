#pragma once

#include "armgen/profile.h"

#include <filesystem>
#include <string>

namespace armgen {

struct GeneratorConfig {
  std::string temp_prefix = "__armgen_tmp_";
  double degenerate_epsilon = 1e-6;
  double bind_weight = 1.0;
  bool strict_bones = false;
  uint32_t default_segments = kDefaultProfileSegments;
};

// Reads a .json or .yaml/.yml file, optionally nested under "generator".
// Missing files, unknown extensions and invalid values fall back to defaults
// with a warning.
GeneratorConfig load_generator_config(const std::filesystem::path& path);

} // namespace armgen
