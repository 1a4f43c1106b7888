#include "armgen/config.h"

#include "armgen/log.h"

#include <nlohmann/json.hpp>

#if ARMGEN_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

#include <cmath>
#include <fstream>
#include <optional>

namespace armgen {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void apply_fields(GeneratorConfig& cfg,
                  const std::optional<std::string>& temp_prefix,
                  const std::optional<double>& degenerate_epsilon,
                  const std::optional<double>& bind_weight,
                  const std::optional<bool>& strict_bones,
                  const std::optional<int64_t>& default_segments) {
  if (temp_prefix.has_value()) {
    if (temp_prefix->empty()) {
      log::warn("generator.temp_prefix must not be empty; keeping default");
    } else {
      cfg.temp_prefix = *temp_prefix;
    }
  }
  if (degenerate_epsilon.has_value()) {
    if (!std::isfinite(*degenerate_epsilon) || *degenerate_epsilon <= 0.0) {
      log::warn("generator.degenerate_epsilon must be positive; keeping default");
    } else {
      cfg.degenerate_epsilon = *degenerate_epsilon;
    }
  }
  if (bind_weight.has_value()) {
    if (!std::isfinite(*bind_weight) || *bind_weight < 0.0 || *bind_weight > 1.0) {
      log::warn("generator.bind_weight must be in [0, 1]; keeping default");
    } else {
      cfg.bind_weight = *bind_weight;
    }
  }
  if (strict_bones.has_value()) {
    cfg.strict_bones = *strict_bones;
  }
  if (default_segments.has_value()) {
    if (*default_segments < static_cast<int64_t>(kMinProfileSegments) || *default_segments > 4096) {
      log::warn("generator.default_segments must be in [3, 4096]; keeping default");
    } else {
      cfg.default_segments = static_cast<uint32_t>(*default_segments);
    }
  }
}
} // namespace

GeneratorConfig load_generator_config(const std::filesystem::path& path) {
  GeneratorConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("generator config not found: ") + path.string());
    return cfg;
  }

  std::optional<std::string> temp_prefix;
  std::optional<double> degenerate_epsilon;
  std::optional<double> bind_weight;
  std::optional<bool> strict_bones;
  std::optional<int64_t> default_segments;

  const auto ext = path.extension().string();
  if (ext == ".json") {
    std::ifstream in(path);
    const nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      log::warn(std::string("generator config is not a JSON object: ") + path.string());
      return cfg;
    }
    const auto& root = j.contains("generator") ? j["generator"] : j;
    if (!root.is_object()) {
      log::warn("generator config section is not an object; using defaults");
      return cfg;
    }

    if (root.contains("temp_prefix") && root["temp_prefix"].is_string()) {
      temp_prefix = root["temp_prefix"].get<std::string>();
    }
    if (root.contains("degenerate_epsilon") && root["degenerate_epsilon"].is_number()) {
      degenerate_epsilon = root["degenerate_epsilon"].get<double>();
    }
    if (root.contains("bind_weight") && root["bind_weight"].is_number()) {
      bind_weight = root["bind_weight"].get<double>();
    }
    if (root.contains("strict_bones") && root["strict_bones"].is_boolean()) {
      strict_bones = root["strict_bones"].get<bool>();
    }
    if (root.contains("default_segments") && root["default_segments"].is_number_integer()) {
      default_segments = root["default_segments"].get<int64_t>();
    }

    apply_fields(cfg, temp_prefix, degenerate_epsilon, bind_weight, strict_bones, default_segments);
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if ARMGEN_ENABLE_DATA_YAML
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["generator"] ? doc["generator"] : doc;

      if (root["temp_prefix"]) temp_prefix = root["temp_prefix"].as<std::string>();
      if (root["degenerate_epsilon"]) degenerate_epsilon = root["degenerate_epsilon"].as<double>();
      if (root["bind_weight"]) bind_weight = root["bind_weight"].as<double>();
      if (root["strict_bones"]) strict_bones = root["strict_bones"].as<bool>();
      if (root["default_segments"]) default_segments = root["default_segments"].as<int64_t>();
    } catch (const YAML::Exception& e) {
      log::warn(std::string("generator config unreadable: ") + e.what());
      return cfg;
    }

    apply_fields(cfg, temp_prefix, degenerate_epsilon, bind_weight, strict_bones, default_segments);
#else
    log::warn("YAML generator config requested but YAML support is disabled.");
#endif
    return cfg;
  }

  log::warn("Unknown generator config extension; using defaults.");
  return cfg;
}

} // namespace armgen
