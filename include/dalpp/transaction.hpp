// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Transaction<Backend> -- root and nested transactions.
//
// Design:
//   - Root transactions come from Database::Transact() and own the engine
//     transaction (BEGIN / COMMIT / ROLLBACK)
//   - Nested transactions come from Transaction::Transact() and own a
//     checkpoint (SAVEPOINT) on the same connection
//   - Committing a nested transaction only releases its checkpoint; nothing
//     is durable until the root commits
//   - Rolling back a nested transaction restores its checkpoint and leaves
//     the parent open
//   - Exactly one of Commit()/Rollback() succeeds per transaction; anything
//     after that fails with kInactive. A parent with an open child can not
//     commit, roll back, prepare or nest
//   - Destroying an open transaction rolls it back
//
// Usage:
//   auto tx = db.Transact(&err);
//   {
//     auto nested = tx.Transact(&err);
//     ...
//     nested.Rollback();   // tx is still usable
//   }
//   tx.Commit();

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "dalpp/error.hpp"
#include "dalpp/query.hpp"
#include "dalpp/session.hpp"
#include "dalpp/statement.hpp"

namespace dalpp {

template <typename Backend> class Database;

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

template <typename Backend>
class Transaction {
 public:
  using StatementType = Statement<Backend>;

  Transaction() = default;

  ~Transaction() {
    if (IsActive()) {
      state_->db->log().Write(LogLevel::kWarn,
                              "Transaction at depth %d abandoned without "
                              "commit; rolling back", state_->depth);
      Error err = state_->RollbackChain();
      if (!err.ok()) {
        state_->db->log().Write(LogLevel::kError, "Rollback failed: %s",
                                err.message);
      }
    }
  }

  // Move
  Transaction(Transaction&& other) noexcept : state_(std::move(other.state_)) {}

  Transaction& operator=(Transaction&& other) noexcept {
    if (this != &other) {
      if (IsActive()) {
        Error err = state_->RollbackChain();
        if (!err.ok()) {
          state_->db->log().Write(LogLevel::kError, "Rollback failed: %s",
                                  err.message);
        }
      }
      state_ = std::move(other.state_);
    }
    return *this;
  }

  // No copy
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  /// Open: neither committed nor rolled back.
  bool IsActive() const { return state_ != nullptr && state_->IsOpen(); }

  TransactionStatus Status() const {
    return state_ ? state_->status : TransactionStatus::kRolledBack;
  }

  /// 0 for the root, parent depth + 1 for nested transactions.
  int32_t Depth() const { return state_ ? state_->depth : -1; }

  // --- Nesting ---

  /// Open a nested transaction backed by a checkpoint.
  Transaction Transact(Error* out_error = nullptr) {
    if (state_ == nullptr) {
      Report(Error::Make(ErrorCode::kMisuse, "Transaction not initialized"),
             out_error);
      return Transaction();
    }
    Error err = state_->CheckActive();
    if (!Report(err, out_error)) { return Transaction(); }

    detail::DatabaseState<Backend>& db = *state_->db;
    auto child = std::make_shared<detail::TransactionState<Backend>>();
    child->db = state_->db;
    child->parent = state_;
    child->depth = state_->depth + 1;
    child->checkpoint = "dalpp_sp_" + std::to_string(++db.checkpoint_seq);

    err = Backend::SetCheckpoint(db.conn, child->checkpoint);
    if (!Report(err, out_error)) {
      child->status = TransactionStatus::kRolledBack;
      return Transaction();
    }
    state_->child = child;
    db.log().Write(LogLevel::kDebug,
                   "Opened nested transaction at depth %d (%s)",
                   child->depth, child->checkpoint.c_str());
    return Transaction(std::move(child));
  }

  // --- Statements ---

  /// Prepare `query` for execution inside this transaction.
  StatementType Prepare(const Query& query, Error* out_error = nullptr) {
    if (state_ == nullptr) {
      Report(Error::Make(ErrorCode::kMisuse, "Transaction not initialized"),
             out_error);
      return StatementType();
    }
    return StatementType::Create(state_->db, state_, query, out_error);
  }

  /// Prepare and run `query` once with no parameters.
  Error Execute(const Query& query) {
    Error err;
    StatementType stmt = Prepare(query, &err);
    if (!err.ok()) { return err; }
    err = stmt.Execute();
    Error close_err = stmt.Close();
    return err.ok() ? close_err : err;
  }

  // --- Finish ---

  Error Commit() {
    if (state_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Transaction not initialized");
    }
    return state_->Commit();
  }

  Error Rollback() {
    if (state_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Transaction not initialized");
    }
    return state_->Rollback();
  }

 private:
  friend class Database<Backend>;

  explicit Transaction(std::shared_ptr<detail::TransactionState<Backend>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::TransactionState<Backend>> state_;
};

}  // namespace dalpp
