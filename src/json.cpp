#include "jsonpatch/json.hpp"

namespace jsonpatch {
namespace {

bool json_equal_impl(const Json& lhs, const Json& rhs) {
  if (lhs.value.index() != rhs.value.index()) {
    return false;
  }
  if (lhs.is_null()) {
    return true;
  }
  if (lhs.is_bool()) {
    return lhs.as_bool() == rhs.as_bool();
  }
  if (lhs.is_number()) {
    return lhs.as_number() == rhs.as_number();
  }
  if (lhs.is_string()) {
    return lhs.as_string() == rhs.as_string();
  }
  if (lhs.is_array()) {
    const auto& a = lhs.as_array();
    const auto& b = rhs.as_array();
    if (a.size() != b.size()) {
      return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
      if (a[i] != b[i] && !json_equal_impl(*a[i], *b[i])) {
        return false;
      }
    }
    return true;
  }
  const auto& a = lhs.as_object();
  const auto& b = rhs.as_object();
  if (a.size() != b.size()) {
    return false;
  }
  for (const auto& [key, value] : a) {
    auto it = b.find(key);
    if (it == b.end()) {
      return false;
    }
    if (value != it->second && !json_equal_impl(*value, *it->second)) {
      return false;
    }
  }
  return true;
}

}  // namespace

Json Json::array(std::initializer_list<Json> items) {
  Array arr;
  arr.reserve(items.size());
  for (const auto& item : items) {
    arr.push_back(make_json(item));
  }
  return Json(std::move(arr));
}

Json Json::object(std::initializer_list<std::pair<const char*, Json>> members) {
  Object obj;
  for (const auto& [key, member] : members) {
    obj[key] = make_json(member);
  }
  return Json(std::move(obj));
}

const char* Json::type_name() const {
  if (is_null()) {
    return "null";
  }
  if (is_bool()) {
    return "boolean";
  }
  if (is_number()) {
    return "number";
  }
  if (is_string()) {
    return "string";
  }
  if (is_array()) {
    return "array";
  }
  return "object";
}

bool json_equal(const Json& lhs, const Json& rhs) {
  return json_equal_impl(lhs, rhs);
}

}  // namespace jsonpatch
