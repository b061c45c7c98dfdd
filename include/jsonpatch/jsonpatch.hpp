#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "jsonpatch/error.hpp"
#include "jsonpatch/json.hpp"
#include "jsonpatch/operations.hpp"
#include "jsonpatch/pointer.hpp"

namespace jsonpatch {

enum class OpType {
  Add,
  Remove,
  Replace,
  Move,
  Copy,
  Test,
};

const char* to_string(OpType type);

class Operation {
 public:
  // `value` is required for Add, Replace and Test; `from` for Move and Copy.
  Operation(OpType type, Pointer path, std::optional<Pointer> from, JsonPtr value);

  OpType type() const { return type_; }
  const Pointer& path() const { return path_; }
  const std::optional<Pointer>& from() const { return from_; }
  const JsonPtr& value() const { return value_; }

  JsonPtr apply(const JsonPtr& doc) const;

 private:
  OpType type_;
  Pointer path_;
  std::optional<Pointer> from_;
  JsonPtr value_;
  std::function<JsonPtr(const JsonPtr&)> fn_;
};

class Patch {
 public:
  // `descriptors` is a decoded array of {"op", "path", "value"/"from"} objects.
  // Paths are pointer strings or arrays of already-split tokens.
  static Patch compile(const Json& descriptors);

  // Applies every operation in order; the first failure aborts the whole patch.
  JsonPtr apply(const JsonPtr& root) const;

  const std::vector<Operation>& operations() const;
  size_t size() const { return operations().size(); }
  bool empty() const { return operations().empty(); }

 private:
  struct Impl;
  std::shared_ptr<const Impl> impl_;

  explicit Patch(std::shared_ptr<const Impl> impl);
};

JsonPtr apply_patch(const JsonPtr& root, const Json& descriptors);

}  // namespace jsonpatch
