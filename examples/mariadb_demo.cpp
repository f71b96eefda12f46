// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp MariaDB demo -- the same queries against Database<MariaBackend>.
//
// Usage:
//   export DALPP_MARIA_DSN="localhost:3306:root:pass:dalpp_test"
//   ./dalpp_mariadb_demo
//
// Before running, create the database:
//   mysql -u root -e "CREATE DATABASE IF NOT EXISTS dalpp_test;"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "dalpp/db.hpp"

static int Fail(const char* what, const dalpp::Error& err) {
  std::fprintf(stderr, "%s failed: %s\n", what, err.message);
  if (err.HasCause()) {
    std::fprintf(stderr, "  caused by (%d): %s\n", err.native_code, err.cause);
  }
  return 1;
}

int main() {
  const char* dsn = std::getenv("DALPP_MARIA_DSN");
  if (dsn == nullptr) {
    dsn = "localhost:3306:root::dalpp_test";
  }

  dalpp::MDb db;
  dalpp::Error err = db.Open(dsn);
  if (!err.ok()) { return Fail("Open", err); }
  std::printf("Connected to %s %s\n", db.Info().type.c_str(),
              db.Info().version.c_str());

  auto tx = db.Transact(&err);
  if (!err.ok()) { return Fail("Transact", err); }
  err = tx.Execute(dalpp::Query::Of("DROP TABLE IF EXISTS emp"));
  if (err.ok()) {
    err = tx.Execute(dalpp::Query::Of(
        "CREATE TABLE emp(empno INT AUTO_INCREMENT PRIMARY KEY, "
        "empname VARCHAR(64))"));
  }
  if (!err.ok()) { return Fail("Create", err); }

  dalpp::Query insert = dalpp::QueryBuilder()
      .ForDefault("INSERT INTO emp(empname) VALUES(:name)")
      .Parameter("name", dalpp::ValueType::kText)
      .Key("empno", dalpp::ValueType::kInt64)
      .Build(&err);
  auto stmt = tx.Prepare(insert, &err);
  if (!err.ok()) { return Fail("Prepare", err); }

  const char* names[] = {"Alice", "Bob", "Charlie"};
  for (const char* name : names) {
    err = stmt.Bind("name", name);
    if (!err.ok()) { return Fail("Bind", err); }
    auto keys = stmt.Insert(&err);
    if (!err.ok() || !keys.Next()) { return Fail("Insert", err); }
    std::printf("  %s -> empno %lld\n", name,
                static_cast<long long>(keys.GetInt64("empno")));
  }
  err = tx.Commit();
  if (!err.ok()) { return Fail("Commit", err); }

  // The engine-specific variant wins on MariaDB
  dalpp::Query select = dalpp::QueryBuilder()
      .ForType("mariadb", "SELECT empno, empname FROM emp ORDER BY empno "
                          "LIMIT 2")
      .ForDefault("SELECT empno, empname FROM emp ORDER BY empno")
      .Column("empno", dalpp::ValueType::kInt64)
      .Column("empname", dalpp::ValueType::kText)
      .Build(&err);
  auto reader = db.Prepare(select, &err);
  auto cursor = reader.Query(&err);
  if (!err.ok()) { return Fail("Query", err); }
  while (cursor.Next()) {
    std::printf("  empno=%lld  empname=%s\n",
                static_cast<long long>(cursor.GetInt64("empno")),
                cursor.GetString("empname").c_str());
  }

  err = db.Close();
  if (!err.ok()) { return Fail("Close", err); }
  std::printf("Done.\n");
  return 0;
}
