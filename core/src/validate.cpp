#include "armgen/validate.h"

#include <cmath>
#include <sstream>

namespace armgen::validate {

namespace {
std::string format_number(double value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}
} // namespace

std::string join_path(const std::string& base, const std::string& key) {
  if (base.empty()) return key;
  return base + "." + key;
}

std::string index_path(const std::string& base, size_t index) {
  return base + "[" + std::to_string(index) + "]";
}

const char* type_name(const json& value) {
  return value.type_name();
}

bool require_finite(double value, const std::string& path, Error& error) {
  if (!std::isfinite(value)) {
    return fail(error, ErrorKind::Range, "expected a finite number, got " + format_number(value), path);
  }
  return true;
}

bool require_positive(double value, const std::string& path, Error& error) {
  if (!require_finite(value, path, error)) return false;
  if (value <= 0.0) {
    return fail(error, ErrorKind::Range, "expected a positive number, got " + format_number(value), path);
  }
  return true;
}

bool read_number(const json& value, const std::string& path, double& out, Error& error) {
  if (value.is_boolean()) {
    return fail(error, ErrorKind::Shape, "expected a number, got boolean", path);
  }
  if (!value.is_number()) {
    return fail(error, ErrorKind::Shape, std::string("expected a number, got ") + type_name(value), path);
  }
  const double v = value.get<double>();
  if (!require_finite(v, path, error)) return false;
  out = v;
  return true;
}

bool read_positive(const json& value, const std::string& path, double& out, Error& error) {
  double v = 0.0;
  if (!read_number(value, path, v, error)) return false;
  if (!require_positive(v, path, error)) return false;
  out = v;
  return true;
}

bool read_uint(const json& value, const std::string& path, uint32_t& out, Error& error) {
  if (value.is_boolean() || !value.is_number_integer()) {
    return fail(error, ErrorKind::Shape, std::string("expected an integer, got ") + type_name(value), path);
  }
  if (value.is_number_unsigned()) {
    const uint64_t v = value.get<uint64_t>();
    if (v > 0xFFFFFFFFull) {
      return fail(error, ErrorKind::Range, "integer out of range: " + std::to_string(v), path);
    }
    out = static_cast<uint32_t>(v);
    return true;
  }
  const int64_t v = value.get<int64_t>();
  if (v < 0 || v > 0xFFFFFFFFll) {
    return fail(error, ErrorKind::Range, "expected a non-negative integer, got " + std::to_string(v), path);
  }
  out = static_cast<uint32_t>(v);
  return true;
}

bool read_bool(const json& value, const std::string& path, bool& out, Error& error) {
  if (!value.is_boolean()) {
    return fail(error, ErrorKind::Shape, std::string("expected a boolean, got ") + type_name(value), path);
  }
  out = value.get<bool>();
  return true;
}

bool read_string(const json& value, const std::string& path, std::string& out, Error& error) {
  if (!value.is_string()) {
    return fail(error, ErrorKind::Shape, std::string("expected a string, got ") + type_name(value), path);
  }
  out = value.get<std::string>();
  return true;
}

bool read_vec3(const json& value, const std::string& path, Vec3& out, Error& error) {
  if (!value.is_array() || value.size() != 3) {
    return fail(error, ErrorKind::Shape, "expected an array of 3 numbers", path);
  }
  double c[3]{};
  for (size_t i = 0; i < 3; ++i) {
    if (!read_number(value[i], index_path(path, i), c[i], error)) return false;
  }
  out = {c[0], c[1], c[2]};
  return true;
}

bool require_object(const json& value, const std::string& path, Error& error) {
  if (!value.is_object()) {
    return fail(error, ErrorKind::Shape, std::string("expected an object, got ") + type_name(value), path);
  }
  return true;
}

bool check_keys(const json& value,
                std::initializer_list<const char*> allowed,
                const std::string& path,
                Error& error) {
  if (!require_object(value, path, error)) return false;
  for (auto it = value.begin(); it != value.end(); ++it) {
    bool known = false;
    for (const char* key : allowed) {
      if (it.key() == key) {
        known = true;
        break;
      }
    }
    if (!known) {
      return fail(error, ErrorKind::Shape, "unknown field '" + it.key() + "'", path);
    }
  }
  return true;
}

} // namespace armgen::validate
