// Copyright (c) 2024 liudegui. MIT License.
// Tests for close cascades with children that fail to close.

#include <catch2/catch.hpp>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "dalpp/database.hpp"

using namespace dalpp;

// ---------------------------------------------------------------------------
// FailingBackend: statements whose SQL contains "fail" cannot be finalized
// ---------------------------------------------------------------------------

struct FailingConnection {
  bool closed = false;
};

struct FailingStatement {
  std::string sql;
};

struct FailingCounters {
  int32_t finalized = 0;
  int32_t connections_closed = 0;
};

struct FailingBackend {
  using Connection = FailingConnection*;
  using Handle = FailingStatement*;
  using Cell = int32_t;

  static FailingCounters& Counters() {
    static FailingCounters counters;
    return counters;
  }

  static const char* TypeName() { return "failing"; }

  static Error Open(const char* /*dsn*/, bool /*read_only*/,
                    int32_t /*busy_timeout_ms*/, Connection* out) {
    *out = new FailingConnection();
    return Error::Ok();
  }

  static Error Close(Connection conn) {
    ++Counters().connections_closed;
    delete conn;
    return Error::Ok();
  }

  static DatabaseInfo Info(Connection /*conn*/) {
    return DatabaseInfo{TypeName(), "1.0"};
  }

  static Error Begin(Connection /*conn*/) { return Error::Ok(); }
  static Error Commit(Connection /*conn*/) { return Error::Ok(); }
  static Error Rollback(Connection /*conn*/) { return Error::Ok(); }

  static Error SetCheckpoint(Connection /*conn*/, const std::string&) {
    return Error::Ok();
  }
  static Error ReleaseCheckpoint(Connection /*conn*/, const std::string&) {
    return Error::Ok();
  }
  static Error RollbackToCheckpoint(Connection /*conn*/, const std::string&) {
    return Error::Ok();
  }

  static Error Prepare(Connection /*conn*/, const std::string& sql,
                       Handle* out) {
    *out = new FailingStatement{sql};
    return Error::Ok();
  }

  static Error Finalize(Handle h) {
    ++Counters().finalized;
    bool fail = h->sql.find("fail") != std::string::npos;
    std::string sql = h->sql;
    delete h;
    if (fail) {
      return Error::Wrap(ErrorCode::kIoError, sql.c_str(), 10, "disk I/O");
    }
    return Error::Ok();
  }

  static Error Execute(Connection /*conn*/, Handle /*h*/, int64_t* changes) {
    if (changes != nullptr) { *changes = 0; }
    return Error::Ok();
  }

  static Error BeginRows(Connection /*conn*/, Handle /*h*/) {
    return Error::Ok();
  }
  static int32_t ColumnCount(Handle /*h*/) { return 0; }
  static std::string ColumnName(Handle /*h*/, int32_t /*col*/) { return ""; }

  static Error FetchRow(Connection /*conn*/, Handle /*h*/,
                        std::vector<Cell>* /*row*/, bool* has_row) {
    *has_row = false;
    return Error::Ok();
  }

  static void EndRows(Handle /*h*/) {}
  static void FreeCell(Cell* /*cell*/) {}

  static std::string GeneratedKeysSql(const std::vector<std::string>&) {
    return "keys";
  }

  static AccessorRegistry<FailingBackend> DefaultAccessors() {
    return AccessorRegistry<FailingBackend>();
  }
};

using FailingDb = Database<FailingBackend>;

struct LogCapture {
  std::vector<std::string> lines;

  static void Callback(void* ctx, LogLevel level, const char* message) {
    static_cast<LogCapture*>(ctx)->lines.push_back(
        std::string(LogLevelName(level)) + " " + message);
  }

  bool Contains(const char* text) const {
    for (const auto& line : lines) {
      if (line.find(text) != std::string::npos) { return true; }
    }
    return false;
  }
};

static FailingDb::OptionsType Capturing(LogCapture* capture) {
  FailingDb::OptionsType options;
  options.log.min_level = LogLevel::kWarn;
  options.log.callback = &LogCapture::Callback;
  options.log.ctx = capture;
  return options;
}

// ---------------------------------------------------------------------------
// Database::Close
// ---------------------------------------------------------------------------

TEST_CASE("Close cascade: database closes every statement", "[cascade]") {
  FailingBackend::Counters() = FailingCounters();
  LogCapture capture;
  FailingDb db;
  REQUIRE(db.Open("any", Capturing(&capture)).ok());

  Error err;
  auto first_ok = db.Prepare(Query::Of("select ok"), &err);
  REQUIRE(err.ok());
  auto first_bad = db.Prepare(Query::Of("fail first"), &err);
  REQUIRE(err.ok());
  auto second_bad = db.Prepare(Query::Of("fail second"), &err);
  REQUIRE(err.ok());
  auto last_ok = db.Prepare(Query::Of("select last"), &err);
  REQUIRE(err.ok());

  err = db.Close();
  REQUIRE(err.code == ErrorCode::kIoError);
  REQUIRE(std::strcmp(err.message, "fail first") == 0);
  REQUIRE(err.native_code == 10);

  REQUIRE(FailingBackend::Counters().finalized == 4);
  REQUIRE(FailingBackend::Counters().connections_closed == 1);
  REQUIRE_FALSE(db.IsOpen());
  REQUIRE_FALSE(first_ok.Valid());
  REQUIRE_FALSE(first_bad.Valid());
  REQUIRE_FALSE(second_bad.Valid());
  REQUIRE_FALSE(last_ok.Valid());

  // The later failure is logged, not returned
  REQUIRE(capture.Contains("WARN Statement close failed: fail second"));
  REQUIRE_FALSE(capture.Contains("fail first"));
}

TEST_CASE("Close cascade: open transaction chain is still rolled back",
          "[cascade]") {
  FailingBackend::Counters() = FailingCounters();
  LogCapture capture;
  FailingDb db;
  REQUIRE(db.Open("any", Capturing(&capture)).ok());

  Error err;
  auto tx = db.Transact(&err);
  REQUIRE(err.ok());
  auto nested = tx.Transact(&err);
  REQUIRE(err.ok());
  auto stmt = nested.Prepare(Query::Of("fail inside"), &err);
  REQUIRE(err.ok());

  err = db.Close();
  REQUIRE(err.code == ErrorCode::kIoError);
  REQUIRE(std::strcmp(err.message, "fail inside") == 0);
  REQUIRE_FALSE(stmt.Valid());
  REQUIRE_FALSE(nested.IsActive());
  REQUIRE_FALSE(tx.IsActive());
  REQUIRE(tx.Status() == TransactionStatus::kRolledBack);
  REQUIRE(FailingBackend::Counters().connections_closed == 1);
}

// ---------------------------------------------------------------------------
// Transaction::Commit / Rollback
// ---------------------------------------------------------------------------

TEST_CASE("Close cascade: commit closes statements and reports the first",
          "[cascade]") {
  FailingBackend::Counters() = FailingCounters();
  LogCapture capture;
  FailingDb db;
  REQUIRE(db.Open("any", Capturing(&capture)).ok());

  Error err;
  auto tx = db.Transact(&err);
  auto a = tx.Prepare(Query::Of("fail a"), &err);
  auto b = tx.Prepare(Query::Of("select b"), &err);
  auto c = tx.Prepare(Query::Of("fail c"), &err);
  REQUIRE(err.ok());

  err = tx.Commit();
  REQUIRE(err.code == ErrorCode::kIoError);
  REQUIRE(std::strcmp(err.message, "fail a") == 0);
  REQUIRE(tx.Status() == TransactionStatus::kCommitted);
  REQUIRE_FALSE(a.Valid());
  REQUIRE_FALSE(b.Valid());
  REQUIRE_FALSE(c.Valid());
  REQUIRE(FailingBackend::Counters().finalized == 3);
  REQUIRE(capture.Contains("WARN Statement close failed: fail c"));

  REQUIRE(db.Close().ok());
}

TEST_CASE("Close cascade: rollback ends the transaction despite failures",
          "[cascade]") {
  FailingBackend::Counters() = FailingCounters();
  LogCapture capture;
  FailingDb db;
  REQUIRE(db.Open("any", Capturing(&capture)).ok());

  Error err;
  auto tx = db.Transact(&err);
  auto nested = tx.Transact(&err);
  auto stmt = nested.Prepare(Query::Of("fail nested"), &err);
  REQUIRE(err.ok());

  err = nested.Rollback();
  REQUIRE(err.code == ErrorCode::kIoError);
  REQUIRE(nested.Status() == TransactionStatus::kRolledBack);
  REQUIRE_FALSE(stmt.Valid());

  // The parent is usable again
  REQUIRE(tx.IsActive());
  REQUIRE(tx.Commit().ok());
  REQUIRE(db.Close().ok());
}

// ---------------------------------------------------------------------------
// Statement::Close
// ---------------------------------------------------------------------------

TEST_CASE("Close cascade: failing statement close is reported once",
          "[cascade]") {
  FailingBackend::Counters() = FailingCounters();
  LogCapture capture;
  FailingDb db;
  REQUIRE(db.Open("any", Capturing(&capture)).ok());

  Error err;
  auto stmt = db.Prepare(Query::Of("fail alone"), &err);
  REQUIRE(err.ok());
  err = db.Close(stmt);
  REQUIRE(err.code == ErrorCode::kIoError);
  REQUIRE(err.HasCause());
  REQUIRE_FALSE(stmt.Valid());

  // Already closed: the database close has nothing left to report
  REQUIRE(db.Close(stmt).ok());
  REQUIRE(db.Close().ok());
  REQUIRE(FailingBackend::Counters().finalized == 1);
}
