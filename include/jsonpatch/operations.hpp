#pragma once

#include "jsonpatch/json.hpp"
#include "jsonpatch/pointer.hpp"

namespace jsonpatch {

// Inserts `value` at `path`. With `replace` set, an object member must already exist
// and the array append token "-" is rejected. Array indices always insert.
JsonPtr add(const JsonPtr& root, const Pointer& path, const JsonPtr& value, bool replace = false);

JsonPtr replace(const JsonPtr& root, const Pointer& path, const JsonPtr& value);

// Removing an absent object member leaves the object unchanged.
JsonPtr remove(const JsonPtr& root, const Pointer& path);

JsonPtr move_or_copy(const JsonPtr& root, const Pointer& from, const Pointer& to, bool remove_source);

JsonPtr move(const JsonPtr& root, const Pointer& from, const Pointer& to);

JsonPtr copy(const JsonPtr& root, const Pointer& from, const Pointer& to);

// Returns `root` itself when the value at `path` equals `expected`.
JsonPtr test(const JsonPtr& root, const Pointer& path, const Json& expected);

}  // namespace jsonpatch
