// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Sqlite3Backend -- backend traits for SQLite3.
//
// Design:
//   - Static functions over sqlite3* / sqlite3_stmt*, no state of its own
//   - Used as template parameter for Database<Backend> and friends
//   - Fetched cells are protected sqlite3_value copies, so cursors can keep
//     earlier rows and seek backwards
//   - Checkpoints are SAVEPOINTs
//   - Generated keys use the function fallback: SELECT last_insert_rowid()

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "sqlite3.h"

#include "dalpp/accessor.hpp"
#include "dalpp/error.hpp"
#include "dalpp/query.hpp"
#include "dalpp/value.hpp"

namespace dalpp {

// ---------------------------------------------------------------------------
// Sqlite3Backend
// ---------------------------------------------------------------------------

struct Sqlite3Backend {
  using Connection = sqlite3*;
  using Handle = sqlite3_stmt*;
  using Cell = sqlite3_value*;

  static const char* TypeName() { return "sqlite"; }

  static ErrorCode MapError(int32_t rc) {
    switch (rc & 0xff) {
      case SQLITE_OK:         return ErrorCode::kOk;
      case SQLITE_BUSY:
      case SQLITE_LOCKED:     return ErrorCode::kBusy;
      case SQLITE_NOTFOUND:   return ErrorCode::kNotFound;
      case SQLITE_CONSTRAINT: return ErrorCode::kConstraint;
      case SQLITE_MISMATCH:   return ErrorCode::kMismatch;
      case SQLITE_MISUSE:     return ErrorCode::kMisuse;
      case SQLITE_RANGE:      return ErrorCode::kRange;
      case SQLITE_IOERR:      return ErrorCode::kIoError;
      case SQLITE_FULL:       return ErrorCode::kFull;
      case SQLITE_READONLY:   return ErrorCode::kReadOnly;
      case SQLITE_CANTOPEN:   return ErrorCode::kNotOpen;
      default:                return ErrorCode::kError;
    }
  }

  static Error EngineError(sqlite3* db, int32_t rc, const char* what) {
    const char* native = (db != nullptr) ? sqlite3_errmsg(db)
                                         : sqlite3_errstr(rc);
    Error e = Error::Format(MapError(rc), "%s: %s", what, native);
    e.SetCause(rc, native);
    return e;
  }

  // --- Connection ---

  static Error Open(const char* path, bool read_only, int32_t busy_timeout_ms,
                    Connection* out) {
    if (path == nullptr || out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    *out = nullptr;
    int32_t flags = read_only ? SQLITE_OPEN_READONLY
                              : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    flags |= SQLITE_OPEN_URI;
    sqlite3* db = nullptr;
    int32_t rc = sqlite3_open_v2(path, &db, flags, nullptr);
    if (rc != SQLITE_OK) {
      Error err = EngineError(db, rc, "sqlite3_open_v2 failed");
      if (db != nullptr) { sqlite3_close(db); }
      return err;
    }
    sqlite3_extended_result_codes(db, 1);
    if (busy_timeout_ms > 0) { sqlite3_busy_timeout(db, busy_timeout_ms); }
    *out = db;
    return Error::Ok();
  }

  static Error Close(Connection db) {
    if (db == nullptr) { return Error::Ok(); }
    int32_t rc = sqlite3_close(db);
    if (rc != SQLITE_OK) { return EngineError(db, rc, "sqlite3_close failed"); }
    return Error::Ok();
  }

  static DatabaseInfo Info(Connection /*db*/) {
    return DatabaseInfo{TypeName(), sqlite3_libversion()};
  }

  static Error Exec(Connection db, const char* sql) {
    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) { return Error::Ok(); }
    Error err = Error::Format(MapError(rc), "%s: %s", sql,
                              errmsg ? errmsg : sqlite3_errmsg(db));
    err.SetCause(rc, errmsg ? errmsg : sqlite3_errmsg(db));
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return err;
  }

  // --- Transactions and checkpoints ---

  static Error Begin(Connection db) { return Exec(db, "BEGIN TRANSACTION;"); }
  static Error Commit(Connection db) { return Exec(db, "COMMIT TRANSACTION;"); }
  static Error Rollback(Connection db) { return Exec(db, "ROLLBACK;"); }

  static Error SetCheckpoint(Connection db, const std::string& name) {
    return Exec(db, ("SAVEPOINT " + name + ";").c_str());
  }

  static Error ReleaseCheckpoint(Connection db, const std::string& name) {
    return Exec(db, ("RELEASE SAVEPOINT " + name + ";").c_str());
  }

  /// ROLLBACK TO leaves the savepoint on the stack; release it as well so
  /// the enclosing transaction continues from the restored state.
  static Error RollbackToCheckpoint(Connection db, const std::string& name) {
    Error err = Exec(db, ("ROLLBACK TO SAVEPOINT " + name + ";").c_str());
    if (!err.ok()) { return err; }
    return ReleaseCheckpoint(db, name);
  }

  // --- Statements ---

  static Error Prepare(Connection db, const std::string& sql, Handle* out) {
    *out = nullptr;
    const char* tail = nullptr;
    int32_t rc = sqlite3_prepare_v2(db, sql.c_str(),
                                    static_cast<int32_t>(sql.size()), out,
                                    &tail);
    if (rc != SQLITE_OK) {
      if (*out != nullptr) {
        sqlite3_finalize(*out);
        *out = nullptr;
      }
      return EngineError(db, rc, "SQL error when preparing query");
    }
    if (*out == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Query contains no statement");
    }
    return Error::Ok();
  }

  static Error Finalize(Handle stmt) {
    // sqlite3_finalize repeats the last step result; the handle is released
    // either way.
    sqlite3_finalize(stmt);
    return Error::Ok();
  }

  /// Run a statement to completion; `changes` receives the affected rows.
  static Error Execute(Connection db, Handle stmt, int64_t* changes) {
    int32_t rc = SQLITE_ROW;
    while (rc == SQLITE_ROW) { rc = sqlite3_step(stmt); }
    if (rc != SQLITE_DONE) {
      Error err = EngineError(db, rc, "Statement execution failed");
      sqlite3_reset(stmt);
      return err;
    }
    if (changes != nullptr) { *changes = sqlite3_changes(db); }
    sqlite3_reset(stmt);
    return Error::Ok();
  }

  // --- Rows ---

  /// Start producing rows. SQLite steps lazily in FetchRow().
  static Error BeginRows(Connection /*db*/, Handle stmt) {
    sqlite3_reset(stmt);
    return Error::Ok();
  }

  static int32_t ColumnCount(Handle stmt) { return sqlite3_column_count(stmt); }

  static std::string ColumnName(Handle stmt, int32_t col) {
    const char* name = sqlite3_column_name(stmt, col);
    return (name != nullptr) ? name : "";
  }

  /// Step once. On a row, append a protected copy of every column to `row`.
  static Error FetchRow(Connection db, Handle stmt, std::vector<Cell>* row,
                        bool* has_row) {
    *has_row = false;
    int32_t rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) { return Error::Ok(); }
    if (rc != SQLITE_ROW) { return EngineError(db, rc, "Row fetch failed"); }

    int32_t n = sqlite3_column_count(stmt);
    row->reserve(static_cast<size_t>(n));
    for (int32_t i = 0; i < n; ++i) {
      sqlite3_value* copy = sqlite3_value_dup(sqlite3_column_value(stmt, i));
      if (copy == nullptr) {
        for (Cell c : *row) { sqlite3_value_free(c); }
        row->clear();
        return Error::Make(ErrorCode::kFull, "Out of memory copying row");
      }
      row->push_back(copy);
    }
    *has_row = true;
    return Error::Ok();
  }

  static void EndRows(Handle stmt) { sqlite3_reset(stmt); }

  static void FreeCell(Cell* cell) {
    sqlite3_value_free(*cell);
    *cell = nullptr;
  }

  // --- Generated keys ---

  static std::string GeneratedKeysSql(const std::vector<std::string>& keys) {
    std::string sql = "SELECT ";
    for (size_t i = 0; i < keys.size(); ++i) {
      if (i > 0) { sql += ", "; }
      sql += "last_insert_rowid() AS \"" + keys[i] + "\"";
    }
    return sql;
  }

  static AccessorRegistry<Sqlite3Backend> DefaultAccessors();
};

// ---------------------------------------------------------------------------
// Default accessors
// ---------------------------------------------------------------------------

namespace sqlite3_accessors {

inline Error BindResult(sqlite3_stmt* stmt, int32_t rc) {
  if (rc == SQLITE_OK) { return Error::Ok(); }
  sqlite3* db = sqlite3_db_handle(stmt);
  return Sqlite3Backend::EngineError(db, rc, "bind failed");
}

template <ValueType kType>
Error Set(sqlite3_stmt* stmt, int32_t index, const Value& value) {
  Error err = detail::CheckAssignable(kType, value);
  if (!err.ok()) { return err; }
  const int32_t param = index + 1;  // SQLite parameters are 1-based
  if (value.IsNull()) { return BindResult(stmt, sqlite3_bind_null(stmt, param)); }

  switch (kType) {
    case ValueType::kBool:
      return BindResult(stmt, sqlite3_bind_int(stmt, param, value.AsBool() ? 1 : 0));
    case ValueType::kInt32:
      return BindResult(stmt, sqlite3_bind_int(stmt, param, value.AsInt32()));
    case ValueType::kInt64:
      return BindResult(stmt, sqlite3_bind_int64(stmt, param, value.AsInt64()));
    case ValueType::kDouble:
      return BindResult(stmt, sqlite3_bind_double(stmt, param, value.AsDouble()));
    case ValueType::kText:
      return BindResult(stmt, sqlite3_bind_text(
          stmt, param, value.AsText().data(),
          static_cast<int32_t>(value.AsText().size()), SQLITE_TRANSIENT));
    case ValueType::kBlob:
      return BindResult(stmt, sqlite3_bind_blob(
          stmt, param, value.BlobData(), static_cast<int32_t>(value.BlobSize()),
          SQLITE_TRANSIENT));
    case ValueType::kNull:
      break;
  }
  return BindResult(stmt, sqlite3_bind_null(stmt, param));
}

template <ValueType kType>
Error Get(sqlite3_value* const& cell, Value* out) {
  if (cell == nullptr || sqlite3_value_type(cell) == SQLITE_NULL) {
    *out = Value();
    return Error::Ok();
  }
  switch (kType) {
    case ValueType::kBool:
      *out = Value(sqlite3_value_int64(cell) != 0);
      break;
    case ValueType::kInt32:
      *out = Value(static_cast<int32_t>(sqlite3_value_int(cell)));
      break;
    case ValueType::kInt64:
      *out = Value(static_cast<int64_t>(sqlite3_value_int64(cell)));
      break;
    case ValueType::kDouble:
      *out = Value(sqlite3_value_double(cell));
      break;
    case ValueType::kText: {
      const unsigned char* text = sqlite3_value_text(cell);
      int32_t len = sqlite3_value_bytes(cell);
      *out = Value(std::string(reinterpret_cast<const char*>(text),
                               static_cast<size_t>(len)));
      break;
    }
    case ValueType::kBlob: {
      const void* blob = sqlite3_value_blob(cell);
      int32_t len = sqlite3_value_bytes(cell);
      *out = Value::Blob(static_cast<const uint8_t*>(blob),
                         static_cast<size_t>(len));
      break;
    }
    case ValueType::kNull:
      *out = Value();
      break;
  }
  return Error::Ok();
}

template <ValueType kType>
Accessor<Sqlite3Backend> Make() {
  Accessor<Sqlite3Backend> a;
  a.set = &Set<kType>;
  a.get = &Get<kType>;
  return a;
}

}  // namespace sqlite3_accessors

inline AccessorRegistry<Sqlite3Backend> Sqlite3Backend::DefaultAccessors() {
  AccessorRegistry<Sqlite3Backend> registry;
  registry.Register(ValueType::kBool, sqlite3_accessors::Make<ValueType::kBool>());
  registry.Register(ValueType::kInt32, sqlite3_accessors::Make<ValueType::kInt32>());
  registry.Register(ValueType::kInt64, sqlite3_accessors::Make<ValueType::kInt64>());
  registry.Register(ValueType::kDouble, sqlite3_accessors::Make<ValueType::kDouble>());
  registry.Register(ValueType::kText, sqlite3_accessors::Make<ValueType::kText>());
  registry.Register(ValueType::kBlob, sqlite3_accessors::Make<ValueType::kBlob>());
  return registry;
}

}  // namespace dalpp
