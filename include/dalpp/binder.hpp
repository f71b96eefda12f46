// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Binder<Backend> -- writes one named parameter.
//
// Design:
//   - Obtained from Statement::GetBinder(name); resolution (declared type,
//     accessor, positional slots) happens once, binding is a loop
//   - A scalar parameter fans a value out to every slot sharing its name
//   - A list parameter of size N holds one slot set per element and binds
//     exactly N values in order
//   - Binding while a cursor of the statement is open closes that cursor

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dalpp/accessor.hpp"
#include "dalpp/error.hpp"
#include "dalpp/session.hpp"
#include "dalpp/value.hpp"

namespace dalpp {

template <typename Backend> class Statement;

// ---------------------------------------------------------------------------
// Binder
// ---------------------------------------------------------------------------

template <typename Backend>
class Binder {
 public:
  Binder() = default;

  bool Valid() const { return stmt_ != nullptr; }
  bool IsList() const { return list_; }
  int32_t ListSize() const {
    return list_ ? static_cast<int32_t>(slots_.size()) : 0;
  }
  const std::string& Name() const { return name_; }

  /// Bind a scalar parameter.
  Error Bind(const Value& value) const {
    Error err = CheckUsable();
    if (!err.ok()) { return err; }
    if (list_) {
      return Error::Format(ErrorCode::kMisuse,
                           "%s is a list parameter, use BindList()",
                           name_.c_str());
    }
    return Write(slots_[0], value);
  }

  /// Bind a list parameter; `values` must hold exactly ListSize() items.
  Error BindList(const std::vector<Value>& values) const {
    Error err = CheckUsable();
    if (!err.ok()) { return err; }
    if (!list_) {
      return Error::Format(ErrorCode::kMisuse, "%s is not a list parameter",
                           name_.c_str());
    }
    if (values.size() != slots_.size()) {
      return Error::Format(ErrorCode::kRange,
                           "List parameter %s expects %zu values, got %zu",
                           name_.c_str(), slots_.size(), values.size());
    }
    for (size_t i = 0; i < values.size(); ++i) {
      err = Write(slots_[i], values[i]);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

 private:
  friend class Statement<Backend>;

  struct Slots {
    Accessor<Backend> accessor;
    std::vector<int32_t> indices;
  };

  Error CheckUsable() const {
    if (stmt_ == nullptr || stmt_->closed) {
      return Error::Make(ErrorCode::kClosed, "Statement is closed");
    }
    return Error::Ok();
  }

  Error Write(const Slots& slots, const Value& value) const {
    Error err = stmt_->CloseCursor();
    if (!err.ok()) { return err; }
    for (int32_t index : slots.indices) {
      err = slots.accessor.set(stmt_->handle, index, value);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  std::shared_ptr<detail::StatementState<Backend>> stmt_;
  std::string name_;
  std::vector<Slots> slots_;
  bool list_ = false;
};

}  // namespace dalpp
