// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp session state -- the ownership tree behind the public handles.
//
// Design:
//   - Database, Transaction, Statement and Cursor are move-only handles over
//     shared state objects defined here
//   - A parent state keeps weak references to its children and closes them
//     first (database -> statements -> cursors); close visits every child,
//     logs secondary failures and reports the first one
//   - A closed state stays readable so stale handles fail with kClosed
//     instead of touching released engine resources
//   - One connection per DatabaseState, no internal locking

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dalpp/accessor.hpp"
#include "dalpp/error.hpp"
#include "dalpp/log.hpp"
#include "dalpp/names.hpp"
#include "dalpp/query.hpp"

namespace dalpp {

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

template <typename Backend>
struct Options {
  /// Open the connection read-only. Transactions are refused.
  bool read_only = false;

  /// Engine busy timeout (SQLite3), 0 to leave the engine default.
  int32_t busy_timeout_ms = 0;

  /// Maps reported column names to the caller's spelling.
  ColumnNameMapper column_name_mapper = DefaultColumnNameMapper();

  AccessorRegistry<Backend> accessors = AccessorRegistry<Backend>::Defaults();

  LogSink log;
};

enum class TransactionStatus : uint8_t {
  kOpen = 0,
  kCommitted,
  kRolledBack,
};

inline const char* TransactionStatusName(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::kOpen:       return "open";
    case TransactionStatus::kCommitted:  return "committed";
    case TransactionStatus::kRolledBack: return "rolled back";
  }
  return "unknown";
}

namespace detail {

template <typename Backend> struct DatabaseState;
template <typename Backend> struct TransactionState;
template <typename Backend> struct StatementState;
template <typename Backend> struct CursorState;

/// Keep the first failure; log the rest.
inline void Accumulate(const Error& err, const LogSink& log, const char* what,
                       Error* first) {
  if (err.ok()) { return; }
  if (first->ok()) {
    *first = err;
    return;
  }
  log.Write(LogLevel::kWarn, "%s: %s", what, err.message);
}

template <typename T>
void Prune(std::vector<std::weak_ptr<T>>* list) {
  size_t out = 0;
  for (size_t i = 0; i < list->size(); ++i) {
    if (!(*list)[i].expired()) { (*list)[out++] = (*list)[i]; }
  }
  list->resize(out);
}

// ---------------------------------------------------------------------------
// DatabaseState
// ---------------------------------------------------------------------------

template <typename Backend>
struct DatabaseState {
  typename Backend::Connection conn = nullptr;
  bool open = false;
  DatabaseInfo info;
  Options<Backend> options;

  std::weak_ptr<TransactionState<Backend>> root;
  std::vector<std::weak_ptr<StatementState<Backend>>> statements;
  uint64_t checkpoint_seq = 0;

  const LogSink& log() const { return options.log; }

  Error CheckOpen() const {
    if (!open) { return Error::Make(ErrorCode::kNotOpen, "Database not open"); }
    return Error::Ok();
  }
};

// ---------------------------------------------------------------------------
// CursorState
// ---------------------------------------------------------------------------

template <typename Backend>
struct CursorState {
  using Handle = typename Backend::Handle;
  using Cell = typename Backend::Cell;

  struct Column {
    Accessor<Backend> accessor;
    int32_t index = 0;
  };

  std::shared_ptr<DatabaseState<Backend>> db;
  Handle handle = nullptr;
  bool owns_handle = false;  // generated-keys cursors run their own query
  std::map<std::string, Column> columns;
  std::vector<std::vector<Cell>> rows;
  int64_t position = -1;  // -1 is before the first row
  bool exhausted = false;
  bool closed = false;

  ~CursorState() {
    Error err = Close();
    if (!err.ok() && db) {
      db->log().Write(LogLevel::kWarn, "Cursor close failed: %s",
                      err.message);
    }
  }

  /// Fetch rows until index `target` is cached or the rows run out.
  Error FetchUntil(int64_t target) {
    while (!exhausted && static_cast<int64_t>(rows.size()) <= target) {
      std::vector<Cell> row;
      bool has_row = false;
      Error err = Backend::FetchRow(db->conn, handle, &row, &has_row);
      if (!err.ok()) { return err; }
      if (!has_row) {
        exhausted = true;
        break;
      }
      rows.push_back(std::move(row));
    }
    return Error::Ok();
  }

  Error Close() {
    if (closed) { return Error::Ok(); }
    closed = true;
    for (auto& row : rows) {
      for (Cell& cell : row) { Backend::FreeCell(&cell); }
    }
    rows.clear();
    columns.clear();
    position = -1;
    if (handle == nullptr) { return Error::Ok(); }
    Handle h = handle;
    handle = nullptr;
    if (owns_handle) { return Backend::Finalize(h); }
    Backend::EndRows(h);
    return Error::Ok();
  }
};

// ---------------------------------------------------------------------------
// StatementState
// ---------------------------------------------------------------------------

template <typename Backend>
struct StatementState {
  using Handle = typename Backend::Handle;

  std::shared_ptr<DatabaseState<Backend>> db;
  std::shared_ptr<TransactionState<Backend>> transaction;  // null: read-only
  QueryDescriptor query;
  Handle handle = nullptr;
  bool closed = false;
  std::weak_ptr<CursorState<Backend>> cursor;

  ~StatementState() {
    Error err = Close();
    if (!err.ok() && db) {
      db->log().Write(LogLevel::kWarn, "Statement close failed: %s",
                      err.message);
    }
  }

  Error CloseCursor() {
    std::shared_ptr<CursorState<Backend>> c = cursor.lock();
    cursor.reset();
    return c ? c->Close() : Error::Ok();
  }

  Error Close() {
    if (closed) { return Error::Ok(); }
    closed = true;
    Error first;
    Accumulate(CloseCursor(), db->log(), "Cursor close failed", &first);
    if (handle != nullptr) {
      Handle h = handle;
      handle = nullptr;
      Accumulate(Backend::Finalize(h), db->log(), "Statement close failed",
                 &first);
    }
    return first;
  }
};

// ---------------------------------------------------------------------------
// TransactionState
// ---------------------------------------------------------------------------

template <typename Backend>
struct TransactionState {
  std::shared_ptr<DatabaseState<Backend>> db;
  std::shared_ptr<TransactionState> parent;  // null for the root
  std::weak_ptr<TransactionState> child;     // open nested transaction
  std::string checkpoint;                    // empty for the root
  int32_t depth = 0;
  TransactionStatus status = TransactionStatus::kOpen;
  std::vector<std::weak_ptr<StatementState<Backend>>> statements;

  bool IsRoot() const { return parent == nullptr; }
  bool IsOpen() const { return status == TransactionStatus::kOpen; }

  bool HasOpenChild() const {
    std::shared_ptr<TransactionState> c = child.lock();
    return c && c->IsOpen();
  }

  /// Open, and not shadowed by an open nested transaction.
  Error CheckActive() const {
    if (!IsOpen()) {
      return Error::Format(ErrorCode::kInactive, "Transaction already %s",
                           TransactionStatusName(status));
    }
    if (HasOpenChild()) {
      return Error::Make(ErrorCode::kMisuse,
                         "Transaction has an open nested transaction");
    }
    return db->CheckOpen();
  }

  Error CloseStatements() {
    Error first;
    for (auto& weak : statements) {
      std::shared_ptr<StatementState<Backend>> s = weak.lock();
      if (s) {
        Accumulate(s->Close(), db->log(), "Statement close failed", &first);
      }
    }
    statements.clear();
    return first;
  }

  void Finish(TransactionStatus terminal) {
    status = terminal;
    if (parent) {
      parent->child.reset();
    } else if (db) {
      db->root.reset();
    }
  }

  Error Commit() {
    if (!IsOpen()) {
      return Error::Format(ErrorCode::kInactive,
                           "Cannot commit, transaction already %s",
                           TransactionStatusName(status));
    }
    if (HasOpenChild()) {
      return Error::Make(ErrorCode::kMisuse,
                         "Cannot commit with an open nested transaction");
    }
    Error err = db->CheckOpen();
    if (!err.ok()) { return err; }

    Error first;
    Accumulate(CloseStatements(), db->log(), "Statement close failed", &first);
    if (IsRoot()) {
      err = Backend::Commit(db->conn);
    } else {
      err = Backend::ReleaseCheckpoint(db->conn, checkpoint);
    }
    if (!err.ok()) {
      // Still open: the caller decides between retry and rollback.
      db->log().Write(LogLevel::kError, "Commit failed at depth %d: %s",
                      depth, err.message);
      return err;
    }
    Finish(TransactionStatus::kCommitted);
    db->log().Write(LogLevel::kDebug, "Committed transaction at depth %d",
                    depth);
    return first;
  }

  Error Rollback() {
    if (!IsOpen()) {
      return Error::Format(ErrorCode::kInactive,
                           "Cannot roll back, transaction already %s",
                           TransactionStatusName(status));
    }
    if (HasOpenChild()) {
      return Error::Make(ErrorCode::kMisuse,
                         "Cannot roll back with an open nested transaction");
    }
    Error first;
    Accumulate(CloseStatements(), db->log(), "Statement close failed", &first);
    if (db->open) {
      Error err = IsRoot() ? Backend::Rollback(db->conn)
                           : Backend::RollbackToCheckpoint(db->conn, checkpoint);
      Accumulate(err, db->log(), "Rollback failed", &first);
    }
    Finish(TransactionStatus::kRolledBack);
    db->log().Write(LogLevel::kDebug, "Rolled back transaction at depth %d",
                    depth);
    return first;
  }

  /// Roll back every open descendant, innermost first, then this.
  Error RollbackChain() {
    Error first;
    std::shared_ptr<TransactionState> c = child.lock();
    if (c && c->IsOpen()) {
      Accumulate(c->RollbackChain(), db->log(), "Nested rollback failed",
                 &first);
    }
    if (IsOpen()) {
      Accumulate(Rollback(), db->log(), "Rollback failed", &first);
    }
    return first;
  }
};

}  // namespace detail

}  // namespace dalpp
