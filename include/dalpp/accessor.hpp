// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Accessor / dalpp::AccessorRegistry -- typed get/set capability.
//
// Design:
//   - An Accessor translates one semantic ValueType to the backend's
//     statement parameters (set) and fetched cells (get)
//   - Plain function pointers, no virtual dispatch
//   - Registry is a value type owned by each Database (Options::accessors);
//     callers may override or add accessors before Open()
//   - Parameter indices handed to set() are 0-based

#pragma once

#include <cstdint>
#include <map>

#include "dalpp/error.hpp"
#include "dalpp/value.hpp"

namespace dalpp {

// ---------------------------------------------------------------------------
// Accessor
// ---------------------------------------------------------------------------

template <typename Backend>
struct Accessor {
  using Handle = typename Backend::Handle;
  using Cell = typename Backend::Cell;

  Error (*set)(Handle handle, int32_t index, const Value& value) = nullptr;
  Error (*get)(const Cell& cell, Value* out) = nullptr;

  bool Valid() const { return set != nullptr && get != nullptr; }
};

// ---------------------------------------------------------------------------
// AccessorRegistry
// ---------------------------------------------------------------------------

template <typename Backend>
class AccessorRegistry {
 public:
  AccessorRegistry() = default;

  /// The backend's accessors for every ValueType.
  static AccessorRegistry Defaults() { return Backend::DefaultAccessors(); }

  void Register(ValueType type, Accessor<Backend> accessor) {
    accessors_[type] = accessor;
  }

  void Remove(ValueType type) { accessors_.erase(type); }

  /// nullptr when no accessor is registered for `type`.
  const Accessor<Backend>* Find(ValueType type) const {
    auto it = accessors_.find(type);
    if (it == accessors_.end() || !it->second.Valid()) { return nullptr; }
    return &it->second;
  }

  size_t Size() const { return accessors_.size(); }

 private:
  std::map<ValueType, Accessor<Backend>> accessors_;
};

namespace detail {

/// Whether `value` may be written to a slot declared as `declared`.
/// NULL fits every declared type.
inline Error CheckAssignable(ValueType declared, const Value& value) {
  if (value.IsNull()) { return Error::Ok(); }
  bool ok = false;
  switch (declared) {
    case ValueType::kNull:
      ok = false;
      break;
    case ValueType::kBool:
    case ValueType::kInt32:
    case ValueType::kInt64:
      ok = value.IsIntegral();
      break;
    case ValueType::kDouble:
      ok = value.IsIntegral() || value.type() == ValueType::kDouble;
      break;
    case ValueType::kText:
      ok = value.type() == ValueType::kText;
      break;
    case ValueType::kBlob:
      ok = value.type() == ValueType::kBlob ||
           value.type() == ValueType::kText;
      break;
  }
  if (ok) { return Error::Ok(); }
  return Error::Format(ErrorCode::kMismatch, "Cannot bind %s value as %s",
                       ValueTypeName(value.type()), ValueTypeName(declared));
}

}  // namespace detail

}  // namespace dalpp
