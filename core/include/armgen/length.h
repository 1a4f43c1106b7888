#pragma once

#include "armgen/error.h"

#include <nlohmann/json.hpp>

#include <string>

namespace armgen {

// Encoded length as written in a spec, before the bone is known.
struct BoneRelativeLength {
  enum class Form : uint8_t {
    Relative = 0,   // 0.4
    Relative2 = 1,  // [0.2, 0.6]
    Absolute = 2    // {"absolute": 1.23}
  };

  Form form = Form::Relative;
  double a = 0.0;
  double b = 0.0;
};

// Scalars resolve with x == y and paired == false.
struct ResolvedLength {
  double x = 0.0;
  double y = 0.0;
  bool paired = false;
};

bool parse_length(const nlohmann::json& value,
                  const std::string& path,
                  BoneRelativeLength& out,
                  Error& error);

bool resolve_length(const BoneRelativeLength& value,
                    double bone_length,
                    const std::string& path,
                    ResolvedLength& out,
                    Error& error);

// parse_length followed by resolve_length. No side effects.
bool resolve_length(const nlohmann::json& value,
                    double bone_length,
                    const std::string& path,
                    ResolvedLength& out,
                    Error& error);

} // namespace armgen
