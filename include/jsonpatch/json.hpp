#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch {

struct Json;

// Documents share unmodified subtrees, so children are only ever reachable as const.
using JsonPtr = std::shared_ptr<const Json>;

struct Json {
  using Object = std::unordered_map<std::string, JsonPtr>;
  using Array = std::vector<JsonPtr>;
  using Value = std::variant<std::nullptr_t, bool, double, std::string, Array, Object>;

  Value value;

  Json() : value(nullptr) {}
  explicit Json(std::nullptr_t) : value(nullptr) {}
  explicit Json(bool b) : value(b) {}
  explicit Json(double n) : value(n) {}
  explicit Json(int n) : value(static_cast<double>(n)) {}
  explicit Json(int64_t n) : value(static_cast<double>(n)) {}
  explicit Json(std::string s) : value(std::move(s)) {}
  explicit Json(const char* s) : value(std::string(s)) {}
  explicit Json(Array a) : value(std::move(a)) {}
  explicit Json(Object o) : value(std::move(o)) {}

  static Json array(std::initializer_list<Json> items);
  static Json object(std::initializer_list<std::pair<const char*, Json>> members);

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
  bool is_bool() const { return std::holds_alternative<bool>(value); }
  bool is_number() const { return std::holds_alternative<double>(value); }
  bool is_string() const { return std::holds_alternative<std::string>(value); }
  bool is_array() const { return std::holds_alternative<Array>(value); }
  bool is_object() const { return std::holds_alternative<Object>(value); }

  bool as_bool() const { return std::get<bool>(value); }
  double as_number() const { return std::get<double>(value); }
  const std::string& as_string() const { return std::get<std::string>(value); }
  const Array& as_array() const { return std::get<Array>(value); }
  const Object& as_object() const { return std::get<Object>(value); }

  const char* type_name() const;
};

template <typename... Args>
JsonPtr make_json(Args&&... args) {
  return std::make_shared<Json>(std::forward<Args>(args)...);
}

bool json_equal(const Json& lhs, const Json& rhs);

inline bool operator==(const Json& lhs, const Json& rhs) { return json_equal(lhs, rhs); }
inline bool operator!=(const Json& lhs, const Json& rhs) { return !json_equal(lhs, rhs); }

}  // namespace jsonpatch
