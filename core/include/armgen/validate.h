#pragma once

#include "armgen/error.h"
#include "armgen/math.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>

namespace armgen::validate {

using json = nlohmann::json;

std::string join_path(const std::string& base, const std::string& key);
std::string index_path(const std::string& base, size_t index);

const char* type_name(const json& value);

bool require_finite(double value, const std::string& path, Error& error);
bool require_positive(double value, const std::string& path, Error& error);

// Booleans are never accepted where a number is expected.
bool read_number(const json& value, const std::string& path, double& out, Error& error);
bool read_positive(const json& value, const std::string& path, double& out, Error& error);
bool read_uint(const json& value, const std::string& path, uint32_t& out, Error& error);
bool read_bool(const json& value, const std::string& path, bool& out, Error& error);
bool read_string(const json& value, const std::string& path, std::string& out, Error& error);
bool read_vec3(const json& value, const std::string& path, Vec3& out, Error& error);

bool require_object(const json& value, const std::string& path, Error& error);
// Shape error naming the first key of `value` not in `allowed`.
bool check_keys(const json& value,
                std::initializer_list<const char*> allowed,
                const std::string& path,
                Error& error);

} // namespace armgen::validate
