// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Statement<Backend> -- prepared query bound to a transaction.
//
// Design:
//   - Move-only RAII handle over one prepared engine statement
//   - Parameters are bound by name (GetBinder/Bind/BindList); the
//     descriptor maps each name to its positional slots
//   - Query() and Insert() return a Cursor; Update()/Execute() may run any
//     number of times
//   - Statements prepared on a Database are read-only; writes need a
//     Transaction. Every operation checks that its owners are still active
//   - Running the statement again, binding, or closing it closes the cursor
//     it produced
//
// Usage:
//   auto stmt = tx.Prepare(insert_query, &err);
//   stmt.Bind("empno", 1);
//   stmt.Bind("empname", "Alice");
//   stmt.Update(&err);

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dalpp/binder.hpp"
#include "dalpp/cursor.hpp"
#include "dalpp/error.hpp"
#include "dalpp/names.hpp"
#include "dalpp/query.hpp"
#include "dalpp/session.hpp"
#include "dalpp/value.hpp"

namespace dalpp {

template <typename Backend> class Database;
template <typename Backend> class Transaction;

// ---------------------------------------------------------------------------
// Statement
// ---------------------------------------------------------------------------

template <typename Backend>
class Statement {
 public:
  using CursorType = Cursor<Backend>;
  using BinderType = Binder<Backend>;

  Statement() = default;

  ~Statement() { Release(); }

  // Move
  Statement(Statement&& other) noexcept : state_(std::move(other.state_)) {}

  Statement& operator=(Statement&& other) noexcept {
    if (this != &other) {
      Release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  // No copy
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool Valid() const { return state_ != nullptr && !state_->closed; }

  /// The resolved query this statement runs.
  const QueryDescriptor& Descriptor() const {
    static const QueryDescriptor kEmpty;
    return state_ ? state_->query : kEmpty;
  }

  // --- Binding ---

  /// Resolve a parameter by (case-insensitive) name.
  BinderType GetBinder(const char* name, Error* out_error = nullptr) const {
    if (!Valid()) {
      Report(Error::Make(ErrorCode::kClosed, "Statement is closed"), out_error);
      return BinderType();
    }
    if (name == nullptr) {
      Report(Error::Make(ErrorCode::kNullParam, "name is null"), out_error);
      return BinderType();
    }

    std::string key = ToLower(name);
    BinderType binder;
    const ListSizes& lists = state_->query.ListParameterSizes();
    auto list = lists.find(key);
    if (list == lists.end()) {
      typename BinderType::Slots slots;
      Error err = ResolveSlots(key, name, &slots);
      if (!Report(err, out_error)) { return BinderType(); }
      binder.slots_.push_back(std::move(slots));
    } else {
      for (int32_t i = 0; i < list->second; ++i) {
        std::string element = ListElementName(key, i);
        typename BinderType::Slots slots;
        Error err = ResolveSlots(element, element.c_str(), &slots);
        if (!Report(err, out_error)) { return BinderType(); }
        binder.slots_.push_back(std::move(slots));
      }
      binder.list_ = true;
    }
    binder.stmt_ = state_;
    binder.name_ = key;
    Report(Error::Ok(), out_error);
    return binder;
  }

  Error Bind(const char* name, const Value& value) {
    Error err;
    BinderType binder = GetBinder(name, &err);
    if (!err.ok()) { return err; }
    return binder.Bind(value);
  }

  Error BindList(const char* name, const std::vector<Value>& values) {
    Error err;
    BinderType binder = GetBinder(name, &err);
    if (!err.ok()) { return err; }
    return binder.BindList(values);
  }

  // --- Execute ---

  /// Run a SELECT. The cursor starts before the first row.
  CursorType Query(Error* out_error = nullptr) {
    Error err = CheckActive(false);
    if (!Report(err, out_error)) { return CursorType(); }
    detail::StatementState<Backend>& s = *state_;

    err = s.CloseCursor();
    if (!Report(err, out_error)) { return CursorType(); }
    err = Backend::BeginRows(s.db->conn, s.handle);
    if (!Report(err, out_error)) { return CursorType(); }

    auto cursor = std::make_shared<detail::CursorState<Backend>>();
    cursor->db = s.db;
    cursor->handle = s.handle;
    cursor->owns_handle = false;
    err = detail::BuildColumns<Backend>(s.handle, s.query.Columns(),
                                        s.db->options, cursor.get());
    if (!Report(err, out_error)) { return CursorType(); }

    s.cursor = cursor;
    return CursorType(std::move(cursor));
  }

  /// Run INSERT/UPDATE/DELETE. Returns affected rows, or -1 on error.
  int64_t Update(Error* out_error = nullptr) {
    Error err = CheckActive(true);
    if (!Report(err, out_error)) { return -1; }
    err = state_->CloseCursor();
    if (!Report(err, out_error)) { return -1; }

    int64_t changes = 0;
    err = Backend::Execute(state_->db->conn, state_->handle, &changes);
    if (!Report(err, out_error)) { return -1; }
    return changes;
  }

  /// Run a statement for its side effects (DDL and the like).
  Error Execute() {
    Error err = CheckActive(true);
    if (!err.ok()) { return err; }
    err = state_->CloseCursor();
    if (!err.ok()) { return err; }
    return Backend::Execute(state_->db->conn, state_->handle, nullptr);
  }

  /// Run an INSERT and return a cursor over the keys declared with
  /// QueryBuilder::Key(). The key row is read before returning.
  CursorType Insert(Error* out_error = nullptr) {
    Error err = CheckActive(true);
    if (!Report(err, out_error)) { return CursorType(); }
    detail::StatementState<Backend>& s = *state_;

    std::vector<std::string> keys;
    for (const auto& kv : s.query.Keys()) { keys.push_back(kv.first); }
    if (keys.empty()) {
      Report(Error::Make(ErrorCode::kMisuse,
                         "Query declares no generated keys; use Update()"),
             out_error);
      return CursorType();
    }

    err = s.CloseCursor();
    if (!Report(err, out_error)) { return CursorType(); }
    err = Backend::Execute(s.db->conn, s.handle, nullptr);
    if (!Report(err, out_error)) { return CursorType(); }

    typename Backend::Handle keys_handle = nullptr;
    err = Backend::Prepare(s.db->conn, Backend::GeneratedKeysSql(keys),
                           &keys_handle);
    if (!Report(err, out_error)) { return CursorType(); }

    auto cursor = std::make_shared<detail::CursorState<Backend>>();
    cursor->db = s.db;
    cursor->handle = keys_handle;
    cursor->owns_handle = true;
    err = detail::BuildColumns<Backend>(keys_handle, s.query.Keys(),
                                        s.db->options, cursor.get());
    if (!Report(err, out_error)) { return CursorType(); }
    err = Backend::BeginRows(s.db->conn, keys_handle);
    if (!Report(err, out_error)) { return CursorType(); }
    err = cursor->FetchUntil(0);
    if (!Report(err, out_error)) { return CursorType(); }

    s.cursor = cursor;
    return CursorType(std::move(cursor));
  }

  // --- Close ---

  /// Close the statement and any cursor it produced. No-op when closed.
  Error Close() {
    if (state_ == nullptr) { return Error::Ok(); }
    std::shared_ptr<detail::StatementState<Backend>> s = std::move(state_);
    state_.reset();
    return s->Close();
  }

 private:
  void Release() {
    if (state_ == nullptr) { return; }
    std::shared_ptr<detail::DatabaseState<Backend>> db = state_->db;
    Error err = Close();
    if (!err.ok() && db) {
      db->log().Write(LogLevel::kWarn, "Statement close failed: %s",
                      err.message);
    }
  }

  friend class Database<Backend>;
  friend class Transaction<Backend>;

  explicit Statement(std::shared_ptr<detail::StatementState<Backend>> state)
      : state_(std::move(state)) {}

  /// Resolve `query` for the live database and prepare it. `transaction` is
  /// null for read-only statements.
  static Statement Create(
      const std::shared_ptr<detail::DatabaseState<Backend>>& db,
      const std::shared_ptr<detail::TransactionState<Backend>>& transaction,
      const dalpp::Query& query, Error* out_error) {
    Error err = db->CheckOpen();
    if (!Report(err, out_error)) { return Statement(); }
    if (transaction) {
      err = transaction->CheckActive();
      if (!Report(err, out_error)) { return Statement(); }
    }

    auto state = std::make_shared<detail::StatementState<Backend>>();
    state->db = db;
    state->transaction = transaction;
    err = query.Resolve(db->info, &state->query);
    if (!Report(err, out_error)) {
      state->closed = true;
      return Statement();
    }

    err = Backend::Prepare(db->conn, state->query.Sql(), &state->handle);
    if (!err.ok()) {
      db->log().Write(LogLevel::kDebug, "Prepare failed for: %s",
                      state->query.Sql().c_str());
      state->closed = true;
      Report(err, out_error);
      return Statement();
    }
    db->log().Write(LogLevel::kDebug, "Prepared: %s",
                    state->query.Sql().c_str());

    detail::Prune(&db->statements);
    db->statements.push_back(state);
    if (transaction) {
      detail::Prune(&transaction->statements);
      transaction->statements.push_back(state);
    }
    Report(Error::Ok(), out_error);
    return Statement(std::move(state));
  }

  Error ResolveSlots(const std::string& key, const char* display,
                     typename BinderType::Slots* out) const {
    const TypeMap& types = state_->query.Parameters();
    auto type = types.find(key);
    if (type == types.end()) {
      return Error::Format(ErrorCode::kNoType,
                           "No type is defined for parameter %s", display);
    }
    const Accessor<Backend>* accessor =
        state_->db->options.accessors.Find(type->second);
    if (accessor == nullptr) {
      return Error::Format(ErrorCode::kNoAccessor,
                           "No accessor is defined for type %s (parameter %s)",
                           ValueTypeName(type->second), display);
    }
    out->accessor = *accessor;
    const std::vector<int32_t>* indices = state_->query.IndicesOf(key);
    if (indices != nullptr) { out->indices = *indices; }
    return Error::Ok();
  }

  Error CheckActive(bool write) const {
    if (!Valid()) { return Error::Make(ErrorCode::kClosed, "Statement is closed"); }
    Error err = state_->db->CheckOpen();
    if (!err.ok()) { return err; }
    if (state_->transaction) { return state_->transaction->CheckActive(); }
    if (write) {
      return Error::Make(ErrorCode::kReadOnly,
                         "Statement is not bound to a transaction");
    }
    return Error::Ok();
  }

  std::shared_ptr<detail::StatementState<Backend>> state_;
};

}  // namespace dalpp
