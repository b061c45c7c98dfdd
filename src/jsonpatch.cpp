#include "jsonpatch/jsonpatch.hpp"

#include <easylogging++.h>

#include <string>
#include <utility>

namespace jsonpatch {
namespace {

struct OpName {
  const char* name;
  OpType type;
};

constexpr OpName kOpNames[] = {
    {"add", OpType::Add},   {"remove", OpType::Remove}, {"replace", OpType::Replace},
    {"move", OpType::Move}, {"copy", OpType::Copy},     {"test", OpType::Test},
};

bool needs_value(OpType type) {
  return type == OpType::Add || type == OpType::Replace || type == OpType::Test;
}

bool needs_from(OpType type) {
  return type == OpType::Move || type == OpType::Copy;
}

class DescriptorCompiler {
 public:
  DescriptorCompiler(const Json& descriptor, size_t index) : descriptor_(descriptor), index_(index) {}

  Operation compile() {
    if (!descriptor_.is_object()) {
      throw error(std::string("expected an object, got ") + descriptor_.type_name());
    }
    const auto& obj = descriptor_.as_object();
    OpType type = parse_op(obj);
    Pointer path = pointer_member(obj, "path");
    std::optional<Pointer> from;
    if (needs_from(type)) {
      from = pointer_member(obj, "from");
    }
    JsonPtr value;
    if (needs_value(type)) {
      value = required(obj, "value");
    }
    return Operation(type, std::move(path), std::move(from), std::move(value));
  }

 private:
  const Json& descriptor_;
  size_t index_;

  OpType parse_op(const Json::Object& obj) const {
    const JsonPtr& op = required(obj, "op");
    if (!op->is_string()) {
      throw error(std::string("\"op\" must be a string, got ") + op->type_name());
    }
    for (const auto& entry : kOpNames) {
      if (op->as_string() == entry.name) {
        return entry.type;
      }
    }
    throw error("unknown op \"" + op->as_string() + "\"");
  }

  const JsonPtr& required(const Json::Object& obj, const char* member) const {
    auto it = obj.find(member);
    if (it == obj.end()) {
      throw error(std::string("missing \"") + member + "\"");
    }
    return it->second;
  }

  Pointer pointer_member(const Json::Object& obj, const char* member) const {
    const JsonPtr& field = required(obj, member);
    if (field->is_string()) {
      try {
        return parse_pointer(field->as_string());
      } catch (const PatchError& e) {
        throw error(std::string("\"") + member + "\" is malformed (" + e.what() + ")");
      }
    }
    if (field->is_array()) {
      Pointer tokens;
      for (const auto& token : field->as_array()) {
        if (!token->is_string()) {
          throw error(std::string("\"") + member + "\" tokens must be strings");
        }
        tokens.push_back(token->as_string());
      }
      return tokens;
    }
    throw error(std::string("\"") + member + "\" must be a string or an array, got " + field->type_name());
  }

  PatchError error(const std::string& message) const {
    return PatchError(ErrorKind::InvalidPatch, "operation " + std::to_string(index_) + ": " + message);
  }
};

}  // namespace

const char* to_string(OpType type) {
  for (const auto& entry : kOpNames) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

Operation::Operation(OpType type, Pointer path, std::optional<Pointer> from, JsonPtr value)
    : type_(type), path_(std::move(path)), from_(std::move(from)), value_(std::move(value)) {
  if (needs_value(type_) && !value_) {
    throw PatchError(ErrorKind::InvalidPatch, std::string(to_string(type_)) + " requires a value");
  }
  if (needs_from(type_) && !from_) {
    throw PatchError(ErrorKind::InvalidPatch, std::string(to_string(type_)) + " requires a source pointer");
  }
  switch (type_) {
    case OpType::Add:
      fn_ = [p = path_, v = value_](const JsonPtr& doc) { return jsonpatch::add(doc, p, v, false); };
      break;
    case OpType::Remove:
      fn_ = [p = path_](const JsonPtr& doc) { return jsonpatch::remove(doc, p); };
      break;
    case OpType::Replace:
      fn_ = [p = path_, v = value_](const JsonPtr& doc) { return jsonpatch::replace(doc, p, v); };
      break;
    case OpType::Move:
      fn_ = [p = path_, f = *from_](const JsonPtr& doc) { return jsonpatch::move(doc, f, p); };
      break;
    case OpType::Copy:
      fn_ = [p = path_, f = *from_](const JsonPtr& doc) { return jsonpatch::copy(doc, f, p); };
      break;
    case OpType::Test:
      fn_ = [p = path_, v = value_](const JsonPtr& doc) { return jsonpatch::test(doc, p, *v); };
      break;
  }
}

JsonPtr Operation::apply(const JsonPtr& doc) const {
  return fn_(doc);
}

struct Patch::Impl {
  std::vector<Operation> operations;
};

Patch::Patch(std::shared_ptr<const Impl> impl) : impl_(std::move(impl)) {}

Patch Patch::compile(const Json& descriptors) {
  if (!descriptors.is_array()) {
    throw PatchError(ErrorKind::InvalidPatch,
                     std::string("expected an array of operations, got ") + descriptors.type_name());
  }
  auto impl = std::make_shared<Impl>();
  const auto& items = descriptors.as_array();
  impl->operations.reserve(items.size());
  for (size_t i = 0; i < items.size(); ++i) {
    try {
      impl->operations.push_back(DescriptorCompiler(*items[i], i).compile());
    } catch (const PatchError& e) {
      VLOG(1) << "Rejected JSON patch: " << e.what();
      throw;
    }
  }
  VLOG(1) << "Compiled JSON patch with " << impl->operations.size() << " operation(s)";
  return Patch(std::move(impl));
}

JsonPtr Patch::apply(const JsonPtr& root) const {
  const auto& ops = operations();
  JsonPtr doc = root;
  for (size_t i = 0; i < ops.size(); ++i) {
    VLOG(2) << "Applying " << to_string(ops[i].type()) << " at \"" << to_string(ops[i].path()) << "\"";
    try {
      doc = ops[i].apply(doc);
    } catch (const PatchError& e) {
      VLOG(1) << "JSON patch stopped at operation " << i << " (" << to_string(ops[i].type())
              << "): " << e.what();
      throw;
    }
  }
  return doc;
}

const std::vector<Operation>& Patch::operations() const {
  if (!impl_) {
    throw std::runtime_error("Patch is not compiled");
  }
  return impl_->operations;
}

JsonPtr apply_patch(const JsonPtr& root, const Json& descriptors) {
  Patch compiled = Patch::compile(descriptors);
  return compiled.apply(root);
}

}  // namespace jsonpatch
