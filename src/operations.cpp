#include "jsonpatch/operations.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "jsonpatch/error.hpp"

namespace jsonpatch {
namespace {

constexpr const char* kAppendToken = "-";

PatchError invalid_pointer(const Pointer& path) {
  return PatchError(ErrorKind::InvalidPointer, to_string(path));
}

size_t bounded_index(const Json::Array& arr, const Pointer& path, size_t pos) {
  std::optional<size_t> index = parse_index(path[pos]);
  if (!index || *index >= arr.size()) {
    throw invalid_pointer(path);
  }
  return *index;
}

JsonPtr add_at(const JsonPtr& node, const Pointer& path, size_t pos, const JsonPtr& value, bool replace) {
  if (pos == path.size()) {
    return value;
  }
  if (pos + 1 == path.size()) {
    const std::string& token = path[pos];
    if (node->is_object()) {
      const auto& obj = node->as_object();
      if (replace && obj.find(token) == obj.end()) {
        throw invalid_pointer(path);
      }
      Json::Object rebuilt = obj;
      rebuilt[token] = value;
      return make_json(std::move(rebuilt));
    }
    if (node->is_array()) {
      const auto& arr = node->as_array();
      if (token == kAppendToken && !replace) {
        Json::Array rebuilt = arr;
        rebuilt.push_back(value);
        return make_json(std::move(rebuilt));
      }
      if (is_index_token(token)) {
        size_t index = bounded_index(arr, path, pos);
        Json::Array rebuilt = arr;
        rebuilt.insert(rebuilt.begin() + static_cast<std::ptrdiff_t>(index), value);
        return make_json(std::move(rebuilt));
      }
    }
  }
  return traverse(node, path, pos, [&value, replace](const JsonPtr& child, const Pointer& p, size_t next) {
    return add_at(child, p, next, value, replace);
  });
}

JsonPtr remove_at(const JsonPtr& node, const Pointer& path, size_t pos) {
  if (pos == path.size()) {
    throw PatchError(ErrorKind::InvalidPointer, "the document root cannot be removed");
  }
  if (pos + 1 == path.size()) {
    const std::string& token = path[pos];
    if (node->is_object()) {
      const auto& obj = node->as_object();
      if (obj.find(token) == obj.end()) {
        return node;
      }
      Json::Object rebuilt = obj;
      rebuilt.erase(token);
      return make_json(std::move(rebuilt));
    }
    if (node->is_array() && is_index_token(token)) {
      const auto& arr = node->as_array();
      size_t index = bounded_index(arr, path, pos);
      Json::Array rebuilt = arr;
      rebuilt.erase(rebuilt.begin() + static_cast<std::ptrdiff_t>(index));
      return make_json(std::move(rebuilt));
    }
  }
  return traverse(node, path, pos, [](const JsonPtr& child, const Pointer& p, size_t next) {
    return remove_at(child, p, next);
  });
}

}  // namespace

JsonPtr add(const JsonPtr& root, const Pointer& path, const JsonPtr& value, bool replace) {
  return add_at(root, path, 0, value, replace);
}

JsonPtr replace(const JsonPtr& root, const Pointer& path, const JsonPtr& value) {
  return add_at(root, path, 0, value, true);
}

JsonPtr remove(const JsonPtr& root, const Pointer& path) {
  return remove_at(root, path, 0);
}

JsonPtr move_or_copy(const JsonPtr& root, const Pointer& from, const Pointer& to, bool remove_source) {
  if (is_prefix(from, to)) {
    throw PatchError(ErrorKind::InvalidPointer,
                     to_string(to) + " is inside the subtree of " + to_string(from));
  }
  JsonPtr value = get_value(root, from);
  JsonPtr source = remove_source ? remove(root, from) : root;
  return add(source, to, value, false);
}

JsonPtr move(const JsonPtr& root, const Pointer& from, const Pointer& to) {
  return move_or_copy(root, from, to, true);
}

JsonPtr copy(const JsonPtr& root, const Pointer& from, const Pointer& to) {
  return move_or_copy(root, from, to, false);
}

JsonPtr test(const JsonPtr& root, const Pointer& path, const Json& expected) {
  JsonPtr actual;
  try {
    actual = get_value(root, path);
  } catch (const PatchError& e) {
    throw PatchError(ErrorKind::PatchNotApplicable, to_string(path) + " does not resolve (" + e.what() + ")");
  }
  if (!json_equal(*actual, expected)) {
    throw PatchError(ErrorKind::PatchNotApplicable,
                     "value at " + to_string(path) + " does not match the expected " + expected.type_name());
  }
  return root;
}

}  // namespace jsonpatch
