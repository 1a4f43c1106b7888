#include "armgen/length.h"

#include "armgen/validate.h"

namespace armgen {

namespace {
bool scaled(double value, double factor, const std::string& path, double& out, Error& error) {
  const double v = value * factor;
  if (!validate::require_positive(v, path, error)) return false;
  out = v;
  return true;
}
} // namespace

bool parse_length(const nlohmann::json& value,
                  const std::string& path,
                  BoneRelativeLength& out,
                  Error& error) {
  if (value.is_boolean()) {
    return fail(error, ErrorKind::Shape, "length must be a number, got boolean", path);
  }
  if (value.is_number()) {
    double v = 0.0;
    if (!validate::read_number(value, path, v, error)) return false;
    out = {BoneRelativeLength::Form::Relative, v, v};
    return true;
  }
  if (value.is_array()) {
    if (value.size() != 2) {
      return fail(error, ErrorKind::Shape,
                  "length pair must have exactly 2 elements, got " + std::to_string(value.size()), path);
    }
    double a = 0.0;
    double b = 0.0;
    if (!validate::read_number(value[0], validate::index_path(path, 0), a, error)) return false;
    if (!validate::read_number(value[1], validate::index_path(path, 1), b, error)) return false;
    out = {BoneRelativeLength::Form::Relative2, a, b};
    return true;
  }
  if (value.is_object()) {
    if (value.size() != 1 || !value.contains("absolute")) {
      return fail(error, ErrorKind::Shape, "length object must carry exactly one key 'absolute'", path);
    }
    double v = 0.0;
    if (!validate::read_number(value["absolute"], validate::join_path(path, "absolute"), v, error)) {
      return false;
    }
    out = {BoneRelativeLength::Form::Absolute, v, v};
    return true;
  }
  return fail(error, ErrorKind::Shape,
              std::string("length must be a number, a [x, y] pair or {absolute: n}, got ") +
                  validate::type_name(value),
              path);
}

bool resolve_length(const BoneRelativeLength& value,
                    double bone_length,
                    const std::string& path,
                    ResolvedLength& out,
                    Error& error) {
  if (!validate::require_positive(bone_length, path + " (bone length)", error)) return false;

  ResolvedLength result;
  switch (value.form) {
    case BoneRelativeLength::Form::Relative:
      if (!scaled(value.a, bone_length, path, result.x, error)) return false;
      result.y = result.x;
      break;
    case BoneRelativeLength::Form::Relative2:
      if (!scaled(value.a, bone_length, validate::index_path(path, 0), result.x, error)) return false;
      if (!scaled(value.b, bone_length, validate::index_path(path, 1), result.y, error)) return false;
      result.paired = true;
      break;
    case BoneRelativeLength::Form::Absolute:
      if (!scaled(value.a, 1.0, validate::join_path(path, "absolute"), result.x, error)) return false;
      result.y = result.x;
      break;
  }
  out = result;
  return true;
}

bool resolve_length(const nlohmann::json& value,
                    double bone_length,
                    const std::string& path,
                    ResolvedLength& out,
                    Error& error) {
  BoneRelativeLength parsed;
  if (!parse_length(value, path, parsed, error)) return false;
  return resolve_length(parsed, bone_length, path, out, error);
}

} // namespace armgen
