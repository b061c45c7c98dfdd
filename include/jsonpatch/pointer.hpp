#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jsonpatch/json.hpp"

namespace jsonpatch {

// Tokens are kept exactly as split on '/'; "~0" and "~1" are not decoded.
using Pointer = std::vector<std::string>;

// Rebuilds the child reached by path[pos - 1]; path[pos..] is what remains below it.
using Continuation = std::function<JsonPtr(const JsonPtr& child, const Pointer& path, size_t pos)>;

Pointer parse_pointer(std::string_view text);

std::string to_string(const Pointer& pointer);

bool is_index_token(std::string_view token);

// Value of an index token, or nullopt when the token is not one or overflows.
std::optional<size_t> parse_index(std::string_view token);

// True when `from` is a proper prefix of `to`.
bool is_prefix(const Pointer& from, const Pointer& to);

JsonPtr traverse(const JsonPtr& root, const Pointer& path, size_t pos, const Continuation& k);

JsonPtr get_value(const JsonPtr& root, const Pointer& path);

}  // namespace jsonpatch
