// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::MariaBackend -- backend traits for MariaDB/MySQL.
//
// Design:
//   - Same static interface as Sqlite3Backend, over MYSQL* and a prepared
//     MYSQL_STMT with its own parameter and result buffers
//   - Parameters are bound through MYSQL_BIND buffers owned by the handle;
//     mysql_stmt_bind_param() runs right before each execution
//   - Result sets are stored client-side; every column is fetched as bytes
//     and converted by the accessors
//   - Checkpoints are SAVEPOINTs; generated keys use LAST_INSERT_ID()
//
// Open() format: "host:port:user:password:database"
//   e.g. "localhost:3306:root:pass:testdb"
//   or   "127.0.0.1:3306:root::mydb" (empty password)

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <errmsg.h>
#include <mysql.h>
#include <mysqld_error.h>

#include "dalpp/accessor.hpp"
#include "dalpp/error.hpp"
#include "dalpp/query.hpp"
#include "dalpp/value.hpp"

namespace dalpp {

// ---------------------------------------------------------------------------
// MariaStatementHandle / MariaCell
// ---------------------------------------------------------------------------

/// Prepared statement plus the buffers its MYSQL_BINDs point into. Sized
/// once at prepare time so the bound addresses stay put.
struct MariaStatementHandle {
  struct ParamBuffer {
    int64_t integer = 0;
    double real = 0.0;
    std::string bytes;
  };

  MYSQL_STMT* stmt = nullptr;
  MYSQL_RES* meta = nullptr;  // null for statements without a result set
  std::vector<MYSQL_BIND> params;
  std::vector<ParamBuffer> param_buffers;

  std::vector<MYSQL_BIND> results;
  std::vector<std::vector<char>> result_buffers;
  std::vector<unsigned long> result_lengths;
  bool has_rows = false;
};

/// One fetched column value.
struct MariaCell {
  bool is_null = true;
  std::string data;
};

// ---------------------------------------------------------------------------
// MariaBackend
// ---------------------------------------------------------------------------

struct MariaBackend {
  using Connection = MYSQL*;
  using Handle = MariaStatementHandle*;
  using Cell = MariaCell;

  static const char* TypeName() { return "mariadb"; }

  static ErrorCode MapError(uint32_t code) {
    switch (code) {
      case 0:                        return ErrorCode::kOk;
      case ER_DUP_ENTRY:
      case ER_NO_REFERENCED_ROW_2:
      case ER_ROW_IS_REFERENCED_2:
      case ER_BAD_NULL_ERROR:        return ErrorCode::kConstraint;
      case ER_LOCK_WAIT_TIMEOUT:
      case ER_LOCK_DEADLOCK:         return ErrorCode::kBusy;
      case ER_NO_SUCH_TABLE:
      case ER_BAD_FIELD_ERROR:       return ErrorCode::kNotFound;
      case ER_CANT_EXECUTE_IN_READ_ONLY_TRANSACTION:
                                     return ErrorCode::kReadOnly;
      case CR_SERVER_GONE_ERROR:
      case CR_SERVER_LOST:           return ErrorCode::kIoError;
      case CR_CONN_HOST_ERROR:
      case CR_CONNECTION_ERROR:      return ErrorCode::kNotOpen;
      default:                       return ErrorCode::kError;
    }
  }

  static Error EngineError(MYSQL* conn, const char* what) {
    uint32_t code = (conn != nullptr) ? mysql_errno(conn) : 0;
    const char* native = (conn != nullptr) ? mysql_error(conn) : "no connection";
    Error e = Error::Format(code != 0 ? MapError(code) : ErrorCode::kError,
                            "%s: %s", what, native);
    e.SetCause(static_cast<int32_t>(code), native);
    return e;
  }

  static Error StatementError(MYSQL_STMT* stmt, const char* what) {
    uint32_t code = mysql_stmt_errno(stmt);
    const char* native = mysql_stmt_error(stmt);
    Error e = Error::Format(code != 0 ? MapError(code) : ErrorCode::kError,
                            "%s: %s", what, native);
    e.SetCause(static_cast<int32_t>(code), native);
    return e;
  }

  // --- Connection ---

  static Error Open(const char* dsn, bool read_only, int32_t busy_timeout_ms,
                    Connection* out) {
    if (dsn == nullptr || out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "dsn is null");
    }
    *out = nullptr;

    // host:port:user:password:database, every field optional
    std::vector<std::string> parts;
    std::string field;
    for (const char* p = dsn; *p != '\0'; ++p) {
      if (*p == ':' && parts.size() < 4) {
        parts.push_back(field);
        field.clear();
      } else {
        field += *p;
      }
    }
    parts.push_back(field);
    parts.resize(5);

    const char* host = parts[0].empty() ? "localhost" : parts[0].c_str();
    uint32_t port = parts[1].empty()
        ? 3306u
        : static_cast<uint32_t>(std::strtoul(parts[1].c_str(), nullptr, 10));
    const char* user = parts[2].empty() ? "root" : parts[2].c_str();
    const char* password = parts[3].empty() ? nullptr : parts[3].c_str();
    const char* database = parts[4].empty() ? nullptr : parts[4].c_str();

    MYSQL* conn = mysql_init(nullptr);
    if (conn == nullptr) {
      return Error::Make(ErrorCode::kFull, "mysql_init failed");
    }
    if (mysql_real_connect(conn, host, user, password, database, port, nullptr,
                           0) == nullptr) {
      Error err = EngineError(conn, "mysql_real_connect failed");
      mysql_close(conn);
      return err;
    }
    if (mysql_set_character_set(conn, "utf8mb4") != 0) {
      Error err = EngineError(conn, "mysql_set_character_set failed");
      mysql_close(conn);
      return err;
    }

    Error err;
    if (read_only) {
      err = Exec(conn, "SET SESSION TRANSACTION READ ONLY");
    }
    if (err.ok() && busy_timeout_ms > 0) {
      // innodb_lock_wait_timeout is in seconds
      std::string sql = "SET SESSION innodb_lock_wait_timeout = " +
                        std::to_string((busy_timeout_ms + 999) / 1000);
      err = Exec(conn, sql.c_str());
    }
    if (!err.ok()) {
      mysql_close(conn);
      return err;
    }
    *out = conn;
    return Error::Ok();
  }

  static Error Close(Connection conn) {
    if (conn != nullptr) { mysql_close(conn); }
    return Error::Ok();
  }

  /// Version is the numeric prefix of the server version
  /// ("10.11.6-MariaDB" reports "10.11.6").
  static DatabaseInfo Info(Connection conn) {
    const char* server = mysql_get_server_info(conn);
    std::string version = (server != nullptr) ? server : "";
    size_t end = version.find_first_not_of("0123456789.");
    if (end != std::string::npos) { version.resize(end); }
    return DatabaseInfo{TypeName(), version};
  }

  static Error Exec(Connection conn, const char* sql) {
    if (mysql_real_query(conn, sql,
                         static_cast<unsigned long>(std::strlen(sql))) != 0) {
      return EngineError(conn, sql);
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (res != nullptr) {
      mysql_free_result(res);
    } else if (mysql_field_count(conn) > 0) {
      return EngineError(conn, sql);
    }
    return Error::Ok();
  }

  // --- Transactions and checkpoints ---

  static Error Begin(Connection conn) { return Exec(conn, "START TRANSACTION"); }
  static Error Commit(Connection conn) { return Exec(conn, "COMMIT"); }
  static Error Rollback(Connection conn) { return Exec(conn, "ROLLBACK"); }

  static Error SetCheckpoint(Connection conn, const std::string& name) {
    return Exec(conn, ("SAVEPOINT " + name).c_str());
  }

  static Error ReleaseCheckpoint(Connection conn, const std::string& name) {
    return Exec(conn, ("RELEASE SAVEPOINT " + name).c_str());
  }

  static Error RollbackToCheckpoint(Connection conn, const std::string& name) {
    Error err = Exec(conn, ("ROLLBACK TO SAVEPOINT " + name).c_str());
    if (!err.ok()) { return err; }
    return ReleaseCheckpoint(conn, name);
  }

  // --- Statements ---

  static Error Prepare(Connection conn, const std::string& sql, Handle* out) {
    *out = nullptr;
    MYSQL_STMT* stmt = mysql_stmt_init(conn);
    if (stmt == nullptr) {
      return EngineError(conn, "mysql_stmt_init failed");
    }
    if (mysql_stmt_prepare(stmt, sql.c_str(),
                           static_cast<unsigned long>(sql.size())) != 0) {
      Error err = StatementError(stmt, "SQL error when preparing query");
      mysql_stmt_close(stmt);
      return err;
    }

    Handle h = new MariaStatementHandle();
    h->stmt = stmt;
    size_t n = static_cast<size_t>(mysql_stmt_param_count(stmt));
    h->params.resize(n);
    h->param_buffers.resize(n);
    for (MYSQL_BIND& bind : h->params) {
      std::memset(&bind, 0, sizeof(MYSQL_BIND));
      bind.buffer_type = MYSQL_TYPE_NULL;
    }
    h->meta = mysql_stmt_result_metadata(stmt);
    *out = h;
    return Error::Ok();
  }

  static Error Finalize(Handle h) {
    if (h == nullptr) { return Error::Ok(); }
    if (h->meta != nullptr) { mysql_free_result(h->meta); }
    Error err;
    if (h->stmt != nullptr && mysql_stmt_close(h->stmt) != 0) {
      err = Error::Make(ErrorCode::kError, "mysql_stmt_close failed");
    }
    delete h;
    return err;
  }

  /// Run a statement to completion; `changes` receives the affected rows.
  static Error Execute(Connection /*conn*/, Handle h, int64_t* changes) {
    Error err = BindAndExecute(h);
    if (!err.ok()) { return err; }
    if (h->meta != nullptr) {
      // A result set nobody asked for; drain it.
      if (mysql_stmt_store_result(h->stmt) != 0) {
        return StatementError(h->stmt, "Statement execution failed");
      }
      mysql_stmt_free_result(h->stmt);
    }
    if (changes != nullptr) {
      *changes = static_cast<int64_t>(mysql_stmt_affected_rows(h->stmt));
    }
    return Error::Ok();
  }

  // --- Rows ---

  /// Execute and store the whole result set client-side, then bind one
  /// byte buffer per column sized to the longest value.
  static Error BeginRows(Connection /*conn*/, Handle h) {
    if (h->has_rows) {
      mysql_stmt_free_result(h->stmt);
      h->has_rows = false;
    }
    Error err = BindAndExecute(h);
    if (!err.ok()) { return err; }
    if (h->meta == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement returns no rows");
    }

    // my_bool on MariaDB Connector/C, bool on MySQL 8
    decltype(MYSQL_BIND::is_null_value) update_max = 1;
    mysql_stmt_attr_set(h->stmt, STMT_ATTR_UPDATE_MAX_LENGTH, &update_max);
    if (mysql_stmt_store_result(h->stmt) != 0) {
      return StatementError(h->stmt, "mysql_stmt_store_result failed");
    }
    h->has_rows = true;

    size_t n = static_cast<size_t>(mysql_num_fields(h->meta));
    h->results.assign(n, MYSQL_BIND());
    h->result_buffers.assign(n, std::vector<char>());
    h->result_lengths.assign(n, 0);
    for (size_t i = 0; i < n; ++i) {
      MYSQL_FIELD* field = mysql_fetch_field_direct(
          h->meta, static_cast<unsigned int>(i));
      size_t size = static_cast<size_t>(field->max_length) + 1;
      h->result_buffers[i].assign(size, '\0');

      MYSQL_BIND& bind = h->results[i];
      std::memset(&bind, 0, sizeof(MYSQL_BIND));
      bind.buffer_type = MYSQL_TYPE_STRING;
      bind.buffer = h->result_buffers[i].data();
      bind.buffer_length = static_cast<unsigned long>(size);
      bind.length = &h->result_lengths[i];
      bind.is_null = &bind.is_null_value;
    }
    if (n > 0 && mysql_stmt_bind_result(h->stmt, h->results.data()) != 0) {
      return StatementError(h->stmt, "mysql_stmt_bind_result failed");
    }
    return Error::Ok();
  }

  static int32_t ColumnCount(Handle h) {
    return (h->meta != nullptr) ? static_cast<int32_t>(mysql_num_fields(h->meta))
                                : 0;
  }

  static std::string ColumnName(Handle h, int32_t col) {
    if (h->meta == nullptr) { return ""; }
    MYSQL_FIELD* field =
        mysql_fetch_field_direct(h->meta, static_cast<unsigned int>(col));
    return (field != nullptr && field->name != nullptr) ? field->name : "";
  }

  static Error FetchRow(Connection /*conn*/, Handle h, std::vector<Cell>* row,
                        bool* has_row) {
    *has_row = false;
    if (!h->has_rows) { return Error::Ok(); }
    int32_t rc = mysql_stmt_fetch(h->stmt);
    if (rc == MYSQL_NO_DATA) { return Error::Ok(); }
    if (rc == MYSQL_DATA_TRUNCATED) {
      return Error::Make(ErrorCode::kError, "Row fetch truncated a column");
    }
    if (rc != 0) { return StatementError(h->stmt, "Row fetch failed"); }

    row->resize(h->results.size());
    for (size_t i = 0; i < h->results.size(); ++i) {
      Cell& cell = (*row)[i];
      cell.is_null = h->results[i].is_null_value != 0;
      if (!cell.is_null) {
        cell.data.assign(h->result_buffers[i].data(),
                         static_cast<size_t>(h->result_lengths[i]));
      }
    }
    *has_row = true;
    return Error::Ok();
  }

  static void EndRows(Handle h) {
    if (h != nullptr && h->has_rows) {
      mysql_stmt_free_result(h->stmt);
      h->has_rows = false;
    }
  }

  static void FreeCell(Cell* cell) {
    cell->is_null = true;
    cell->data.clear();
  }

  // --- Generated keys ---

  static std::string GeneratedKeysSql(const std::vector<std::string>& keys) {
    std::string sql = "SELECT ";
    for (size_t i = 0; i < keys.size(); ++i) {
      if (i > 0) { sql += ", "; }
      sql += "LAST_INSERT_ID() AS `" + keys[i] + "`";
    }
    return sql;
  }

  static AccessorRegistry<MariaBackend> DefaultAccessors();

 private:
  static Error BindAndExecute(Handle h) {
    if (!h->params.empty() &&
        mysql_stmt_bind_param(h->stmt, h->params.data()) != 0) {
      return StatementError(h->stmt, "mysql_stmt_bind_param failed");
    }
    if (mysql_stmt_execute(h->stmt) != 0) {
      return StatementError(h->stmt, "Statement execution failed");
    }
    return Error::Ok();
  }
};

// ---------------------------------------------------------------------------
// Default accessors
// ---------------------------------------------------------------------------

namespace maria_accessors {

template <ValueType kType>
Error Set(MariaStatementHandle* h, int32_t index, const Value& value) {
  Error err = detail::CheckAssignable(kType, value);
  if (!err.ok()) { return err; }
  if (index < 0 || static_cast<size_t>(index) >= h->params.size()) {
    return Error::Format(ErrorCode::kRange, "Parameter %d out of range", index);
  }

  MYSQL_BIND& bind = h->params[static_cast<size_t>(index)];
  MariaStatementHandle::ParamBuffer& buf =
      h->param_buffers[static_cast<size_t>(index)];
  std::memset(&bind, 0, sizeof(MYSQL_BIND));
  if (value.IsNull()) {
    bind.buffer_type = MYSQL_TYPE_NULL;
    return Error::Ok();
  }

  switch (kType) {
    case ValueType::kBool:
    case ValueType::kInt32:
    case ValueType::kInt64:
      buf.integer = value.AsInt64();
      bind.buffer_type = MYSQL_TYPE_LONGLONG;
      bind.buffer = &buf.integer;
      break;
    case ValueType::kDouble:
      buf.real = value.AsDouble();
      bind.buffer_type = MYSQL_TYPE_DOUBLE;
      bind.buffer = &buf.real;
      break;
    case ValueType::kText:
      buf.bytes = value.AsText();
      bind.buffer_type = MYSQL_TYPE_STRING;
      bind.buffer = &buf.bytes[0];
      bind.buffer_length = static_cast<unsigned long>(buf.bytes.size());
      break;
    case ValueType::kBlob:
      if (value.type() == ValueType::kText) {
        buf.bytes = value.AsText();
      } else {
        buf.bytes.assign(reinterpret_cast<const char*>(value.BlobData()),
                         value.BlobSize());
      }
      bind.buffer_type = MYSQL_TYPE_BLOB;
      bind.buffer = &buf.bytes[0];
      bind.buffer_length = static_cast<unsigned long>(buf.bytes.size());
      break;
    case ValueType::kNull:
      bind.buffer_type = MYSQL_TYPE_NULL;
      break;
  }
  return Error::Ok();
}

template <ValueType kType>
Error Get(const MariaCell& cell, Value* out) {
  if (cell.is_null) {
    *out = Value();
    return Error::Ok();
  }
  const char* text = cell.data.c_str();
  switch (kType) {
    case ValueType::kBool:
      *out = Value(std::strtoll(text, nullptr, 10) != 0);
      break;
    case ValueType::kInt32:
      *out = Value(static_cast<int32_t>(std::strtol(text, nullptr, 10)));
      break;
    case ValueType::kInt64:
      *out = Value(static_cast<int64_t>(std::strtoll(text, nullptr, 10)));
      break;
    case ValueType::kDouble:
      *out = Value(std::strtod(text, nullptr));
      break;
    case ValueType::kText:
      *out = Value(cell.data);
      break;
    case ValueType::kBlob:
      *out = Value::Blob(reinterpret_cast<const uint8_t*>(cell.data.data()),
                         cell.data.size());
      break;
    case ValueType::kNull:
      *out = Value();
      break;
  }
  return Error::Ok();
}

template <ValueType kType>
Accessor<MariaBackend> Make() {
  Accessor<MariaBackend> a;
  a.set = &Set<kType>;
  a.get = &Get<kType>;
  return a;
}

}  // namespace maria_accessors

inline AccessorRegistry<MariaBackend> MariaBackend::DefaultAccessors() {
  AccessorRegistry<MariaBackend> registry;
  registry.Register(ValueType::kBool, maria_accessors::Make<ValueType::kBool>());
  registry.Register(ValueType::kInt32, maria_accessors::Make<ValueType::kInt32>());
  registry.Register(ValueType::kInt64, maria_accessors::Make<ValueType::kInt64>());
  registry.Register(ValueType::kDouble, maria_accessors::Make<ValueType::kDouble>());
  registry.Register(ValueType::kText, maria_accessors::Make<ValueType::kText>());
  registry.Register(ValueType::kBlob, maria_accessors::Make<ValueType::kBlob>());
  return registry;
}

}  // namespace dalpp
