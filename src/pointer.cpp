#include "jsonpatch/pointer.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <utility>

#include "jsonpatch/error.hpp"

namespace jsonpatch {
namespace {

PatchError invalid_pointer(const Pointer& path) {
  return PatchError(ErrorKind::InvalidPointer, to_string(path));
}

Json::Object::const_iterator find_member(const Json::Object& obj, const Pointer& path, size_t pos) {
  auto it = obj.find(path[pos]);
  if (it == obj.end()) {
    throw invalid_pointer(path);
  }
  return it;
}

size_t element_index(const Json::Array& arr, const Pointer& path, size_t pos) {
  std::optional<size_t> index = parse_index(path[pos]);
  if (!index || *index >= arr.size()) {
    throw invalid_pointer(path);
  }
  return *index;
}

}  // namespace

Pointer parse_pointer(std::string_view text) {
  Pointer tokens;
  if (text.empty()) {
    return tokens;
  }
  if (text.front() != '/') {
    throw PatchError(ErrorKind::InvalidPointer, "\"" + std::string(text) + "\" does not start with '/'");
  }
  size_t start = 1;
  while (true) {
    size_t slash = text.find('/', start);
    if (slash == std::string_view::npos) {
      tokens.emplace_back(text.substr(start));
      break;
    }
    tokens.emplace_back(text.substr(start, slash - start));
    start = slash + 1;
  }
  return tokens;
}

std::string to_string(const Pointer& pointer) {
  std::string out;
  for (const auto& token : pointer) {
    out.push_back('/');
    out += token;
  }
  return out;
}

bool is_index_token(std::string_view token) {
  if (token.empty()) {
    return false;
  }
  for (char c : token) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<size_t> parse_index(std::string_view token) {
  if (!is_index_token(token)) {
    return std::nullopt;
  }
  std::string digits(token);
  errno = 0;
  unsigned long long value = std::strtoull(digits.c_str(), nullptr, 10);
  if (errno == ERANGE || value > std::numeric_limits<size_t>::max()) {
    return std::nullopt;
  }
  return static_cast<size_t>(value);
}

bool is_prefix(const Pointer& from, const Pointer& to) {
  if (from.size() >= to.size()) {
    return false;
  }
  for (size_t i = 0; i < from.size(); ++i) {
    if (from[i] != to[i]) {
      return false;
    }
  }
  return true;
}

JsonPtr traverse(const JsonPtr& root, const Pointer& path, size_t pos, const Continuation& k) {
  if (pos >= path.size()) {
    return root;
  }
  if (root->is_object()) {
    const auto& obj = root->as_object();
    auto it = find_member(obj, path, pos);
    JsonPtr child = k(it->second, path, pos + 1);
    Json::Object rebuilt = obj;
    rebuilt[it->first] = std::move(child);
    return make_json(std::move(rebuilt));
  }
  if (root->is_array()) {
    const auto& arr = root->as_array();
    size_t index = element_index(arr, path, pos);
    JsonPtr child = k(arr[index], path, pos + 1);
    Json::Array rebuilt = arr;
    rebuilt[index] = std::move(child);
    return make_json(std::move(rebuilt));
  }
  throw invalid_pointer(path);
}

JsonPtr get_value(const JsonPtr& root, const Pointer& path) {
  JsonPtr node = root;
  for (size_t pos = 0; pos < path.size(); ++pos) {
    if (node->is_object()) {
      node = find_member(node->as_object(), path, pos)->second;
    } else if (node->is_array()) {
      const auto& arr = node->as_array();
      node = arr[element_index(arr, path, pos)];
    } else {
      throw invalid_pointer(path);
    }
  }
  return node;
}

}  // namespace jsonpatch
