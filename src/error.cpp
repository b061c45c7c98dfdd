#include "jsonpatch/error.hpp"

namespace jsonpatch {
namespace {

const char* describe(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidPointer: return "Invalid JSON pointer";
    case ErrorKind::InvalidPatch: return "Invalid JSON patch";
    case ErrorKind::PatchNotApplicable: return "Non-applicable JSON patch";
  }
  return "JSON patch error";
}

std::string format_message(ErrorKind kind, const std::string& detail) {
  if (detail.empty()) {
    return describe(kind);
  }
  return std::string(describe(kind)) + ": " + detail;
}

}  // namespace

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidPointer: return "invalid_pointer";
    case ErrorKind::InvalidPatch: return "invalid_patch";
    case ErrorKind::PatchNotApplicable: return "patch_not_applicable";
  }
  return "unknown";
}

PatchError::PatchError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(format_message(kind, detail)), kind_(kind) {}

}  // namespace jsonpatch
