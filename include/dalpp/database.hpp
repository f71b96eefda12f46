// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Database<Backend> -- backend-agnostic database handle.
//
// Design:
//   - Owns exactly one engine connection; no internal locking, callers
//     serialize use of a Database and everything opened from it
//   - Move-only, RAII; Close() cascades to statements, cursors and the open
//     transaction chain, attempting every child before reporting the first
//     failure
//   - Reports engine type and version for query variant selection
//   - Errors via Error return / Error* out parameter, no exceptions
//
// Usage:
//   dalpp::Db db;
//   db.Open(":memory:");
//   auto tx = db.Transact();
//   tx.Execute(dalpp::Query::Of("CREATE TABLE t(id INTEGER)"));
//   tx.Commit();

#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "dalpp/cursor.hpp"
#include "dalpp/error.hpp"
#include "dalpp/log.hpp"
#include "dalpp/query.hpp"
#include "dalpp/session.hpp"
#include "dalpp/statement.hpp"
#include "dalpp/transaction.hpp"

namespace dalpp {

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------

template <typename Backend>
class Database {
 public:
  using OptionsType     = Options<Backend>;
  using TransactionType = Transaction<Backend>;
  using StatementType   = Statement<Backend>;
  using CursorType      = Cursor<Backend>;

  Database() = default;

  ~Database() { Release(); }

  // Move
  Database(Database&& other) noexcept : state_(std::move(other.state_)) {}

  Database& operator=(Database&& other) noexcept {
    if (this != &other) {
      Release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  // No copy
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // --- Open / Close ---

  Error Open(const char* dsn) { return Open(dsn, OptionsType()); }

  Error Open(const char* dsn, OptionsType options) {
    if (dsn == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "dsn is null");
    }
    Error err = Close();
    if (!err.ok()) { return err; }

    auto state = std::make_shared<detail::DatabaseState<Backend>>();
    state->options = std::move(options);
    err = Backend::Open(dsn, state->options.read_only,
                        state->options.busy_timeout_ms, &state->conn);
    if (!err.ok()) {
      state->log().Write(LogLevel::kError, "Open failed: %s", err.message);
      return err;
    }
    state->open = true;
    state->info = Backend::Info(state->conn);
    state->log().Write(LogLevel::kInfo, "Opened %s %s%s",
                       state->info.type.c_str(), state->info.version.c_str(),
                       state->options.read_only ? " (read-only)" : "");
    state_ = std::move(state);
    return Error::Ok();
  }

  /// Roll back the open transaction chain, close every statement and
  /// cursor, then the connection. No-op when already closed.
  Error Close() {
    if (state_ == nullptr) { return Error::Ok(); }
    std::shared_ptr<detail::DatabaseState<Backend>> s = std::move(state_);
    state_.reset();
    if (!s->open) { return Error::Ok(); }

    Error first;
    for (auto& weak : s->statements) {
      std::shared_ptr<detail::StatementState<Backend>> stmt = weak.lock();
      if (stmt) {
        detail::Accumulate(stmt->Close(), s->log(), "Statement close failed",
                           &first);
      }
    }
    s->statements.clear();

    std::shared_ptr<detail::TransactionState<Backend>> root = s->root.lock();
    if (root && root->IsOpen()) {
      s->log().Write(LogLevel::kWarn,
                     "Closing database with an open transaction; "
                     "rolling back");
      detail::Accumulate(root->RollbackChain(), s->log(), "Rollback failed",
                         &first);
    }

    detail::Accumulate(Backend::Close(s->conn), s->log(),
                       "Connection close failed", &first);
    s->conn = nullptr;
    s->open = false;
    s->log().Write(LogLevel::kInfo, "Closed %s database",
                   s->info.type.c_str());
    return first;
  }

  bool IsOpen() const { return state_ != nullptr && state_->open; }

  /// Engine type and version of the open connection.
  DatabaseInfo Info() const { return state_ ? state_->info : DatabaseInfo(); }

  // --- Transactions ---

  /// Start the root transaction. Only one chain may be open at a time.
  TransactionType Transact(Error* out_error = nullptr) {
    Error err = CheckOpen();
    if (!Report(err, out_error)) { return TransactionType(); }
    if (state_->options.read_only) {
      Report(Error::Make(ErrorCode::kReadOnly, "Database is read-only"),
             out_error);
      return TransactionType();
    }
    std::shared_ptr<detail::TransactionState<Backend>> current =
        state_->root.lock();
    if (current && current->IsOpen()) {
      Report(Error::Make(ErrorCode::kMisuse,
                         "A transaction is already open on this database"),
             out_error);
      return TransactionType();
    }

    err = Backend::Begin(state_->conn);
    if (!Report(err, out_error)) { return TransactionType(); }

    auto root = std::make_shared<detail::TransactionState<Backend>>();
    root->db = state_;
    root->depth = 0;
    state_->root = root;
    state_->log().Write(LogLevel::kDebug, "Began transaction");
    return TransactionType(std::move(root));
  }

  /// Roll back `tx` if it is still open. Closed or empty: no-op.
  Error Rollback(TransactionType& tx) {
    if (!tx.IsActive()) { return Error::Ok(); }
    return tx.state_->RollbackChain();
  }

  // --- Statements ---

  /// Prepare a read-only statement outside any transaction.
  StatementType Prepare(const Query& query, Error* out_error = nullptr) {
    Error err = CheckOpen();
    if (!Report(err, out_error)) { return StatementType(); }
    return StatementType::Create(state_, nullptr, query, out_error);
  }

  /// Close helpers; closed or empty handles are a no-op.
  Error Close(StatementType& stmt) { return stmt.Close(); }
  Error Close(CursorType& cursor) { return cursor.Close(); }

 private:
  void Release() {
    if (state_ == nullptr) { return; }
    std::shared_ptr<detail::DatabaseState<Backend>> s = state_;
    Error err = Close();
    if (!err.ok()) {
      s->log().Write(LogLevel::kError, "Close failed: %s", err.message);
    }
  }

  Error CheckOpen() const {
    if (state_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    return state_->CheckOpen();
  }

  std::shared_ptr<detail::DatabaseState<Backend>> state_;
};

}  // namespace dalpp
