#pragma once

#include <stdexcept>
#include <string>

namespace jsonpatch {

enum class ErrorKind {
  InvalidPointer,
  InvalidPatch,
  PatchNotApplicable,
};

const char* to_string(ErrorKind kind);

class PatchError : public std::runtime_error {
 public:
  PatchError(ErrorKind kind, const std::string& detail);

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace jsonpatch
