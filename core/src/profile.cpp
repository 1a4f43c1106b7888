#include "armgen/profile.h"

#include "armgen/validate.h"

#include <cctype>

namespace armgen {

const char* const kProfileGrammar =
    "expected one of: null, 'square', 'rectangle', 'circle(N)', 'hexagon(N)' with integer N >= 3";

namespace {

std::string trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

bool strip_call(const std::string& text, const std::string& name, std::string& inner) {
  const std::string open = name + "(";
  if (text.size() <= open.size() || text.rfind(open, 0) != 0 || text.back() != ')') {
    return false;
  }
  inner = text.substr(open.size(), text.size() - open.size() - 1);
  return true;
}

bool parse_segments(const std::string& inner, uint32_t& out) {
  if (inner.empty() || inner.size() > 9) return false;
  uint32_t value = 0;
  for (char c : inner) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  out = value;
  return true;
}

bool profile_error(Error& error, ErrorKind kind, const std::string& what, const std::string& path) {
  return fail(error, kind, what + "; " + kProfileGrammar, path);
}

bool parse_profile_text(const std::string& raw, const std::string& path, Profile& out, Error& error) {
  const std::string text = trim(raw);
  if (text == "square") {
    out = {ProfileKind::Square, 4};
    return true;
  }
  if (text == "rectangle") {
    out = {ProfileKind::Rectangle, 4};
    return true;
  }

  std::string inner;
  if (strip_call(text, "circle", inner) || strip_call(text, "hexagon", inner)) {
    uint32_t segments = 0;
    if (!parse_segments(trim(inner), segments)) {
      return profile_error(error, ErrorKind::Shape, "invalid profile segment count '" + inner + "'", path);
    }
    if (segments < kMinProfileSegments) {
      return profile_error(error, ErrorKind::Range,
                           "profile segments must be >= 3, got " + std::to_string(segments), path);
    }
    out = {ProfileKind::Circle, segments};
    return true;
  }
  return profile_error(error, ErrorKind::Shape, "unknown profile '" + raw + "'", path);
}

} // namespace

const char* profile_kind_name(ProfileKind kind) {
  switch (kind) {
    case ProfileKind::Circle:
      return "circle";
    case ProfileKind::Square:
      return "square";
    case ProfileKind::Rectangle:
      return "rectangle";
  }
  return "unknown";
}

bool parse_profile(const nlohmann::json& value,
                   const std::string& path,
                   Profile& out,
                   Error& error,
                   uint32_t default_segments) {
  if (value.is_null()) {
    out = {ProfileKind::Circle, default_segments};
    return true;
  }
  if (!value.is_string()) {
    return profile_error(error, ErrorKind::Shape,
                         std::string("profile must be a string, got ") + validate::type_name(value), path);
  }
  return parse_profile_text(value.get<std::string>(), path, out, error);
}

bool parse_profile(const std::optional<std::string>& text, Profile& out, Error& error) {
  if (!text.has_value()) {
    out = {ProfileKind::Circle, kDefaultProfileSegments};
    return true;
  }
  return parse_profile_text(*text, "profile", out, error);
}

} // namespace armgen
