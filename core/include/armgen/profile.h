#pragma once

#include "armgen/error.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace armgen {

enum class ProfileKind : uint8_t {
  Circle = 0,
  Square = 1,
  Rectangle = 2
};

struct Profile {
  ProfileKind kind = ProfileKind::Circle;
  uint32_t segments = 12;
};

constexpr uint32_t kDefaultProfileSegments = 12;
constexpr uint32_t kMinProfileSegments = 3;

// Quoted verbatim in every profile diagnostic.
extern const char* const kProfileGrammar;

const char* profile_kind_name(ProfileKind kind);

// null -> circle(default_segments); "square"; "rectangle"; "circle(N)";
// "hexagon(N)" (a circle with N segments). N is an integer >= 3.
bool parse_profile(const nlohmann::json& value,
                   const std::string& path,
                   Profile& out,
                   Error& error,
                   uint32_t default_segments = kDefaultProfileSegments);

bool parse_profile(const std::optional<std::string>& text, Profile& out, Error& error);

} // namespace armgen
