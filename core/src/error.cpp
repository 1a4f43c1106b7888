#include "armgen/error.h"

#include <utility>

namespace armgen {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "ok";
    case ErrorKind::Shape:
      return "shape";
    case ErrorKind::Range:
      return "range";
    case ErrorKind::Cycle:
      return "cycle";
    case ErrorKind::MissingTarget:
      return "missing_target";
    case ErrorKind::Collision:
      return "collision";
    case ErrorKind::Conflict:
      return "conflict";
    case ErrorKind::Internal:
      return "internal";
    case ErrorKind::Kernel:
      return "kernel";
  }
  return "unknown";
}

std::string Error::describe() const {
  std::string out = std::string("[") + error_kind_name(kind) + "] ";
  if (!path.empty()) {
    out += path + ": ";
  }
  out += message;
  return out;
}

bool fail(Error& out, ErrorKind kind, std::string message, std::string path) {
  out.kind = kind;
  out.message = std::move(message);
  out.path = std::move(path);
  return false;
}

} // namespace armgen
