#pragma once

#include <string>

namespace armgen {

enum class ErrorKind {
  None = 0,
  Shape,          // wrong type or arity for a field
  Range,          // non-finite, non-positive, below minimum
  Cycle,          // alias chain revisits a key
  MissingTarget,  // alias, bone, shape or group not found
  Collision,      // many-to-one rename
  Conflict,       // rename destination already taken
  Internal,       // planner failed to make progress
  Kernel          // reported by an IMeshKernel implementation
};

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::string path;

  bool ok() const { return kind == ErrorKind::None; }
  std::string describe() const;
};

// Soft problem that skipped part of the work without failing it.
struct Warning {
  std::string bone;
  std::string reason;
};

const char* error_kind_name(ErrorKind kind);

// Fills `out` and returns false so call sites can `return fail(...)`.
bool fail(Error& out, ErrorKind kind, std::string message, std::string path = {});

} // namespace armgen
