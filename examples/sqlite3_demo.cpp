// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp SQLite3 demo -- transactions, named parameters and cursors.
//
// Usage:
//   ./dalpp_sqlite3_demo

#include <cstdio>
#include <cstring>

#include "dalpp/db.hpp"

int main() {
  dalpp::Db::OptionsType options;
  options.log.min_level = dalpp::LogLevel::kInfo;

  dalpp::Db db;
  dalpp::Error err = db.Open(":memory:", options);
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed: %s\n", err.message);
    return 1;
  }

  // Schema
  auto tx = db.Transact(&err);
  err = tx.Execute(dalpp::Query::Of(
      "CREATE TABLE emp(empno INTEGER PRIMARY KEY, empname TEXT, "
      "hire_year INTEGER);"));
  if (!err.ok()) {
    std::fprintf(stderr, "Create failed: %s\n", err.message);
    return 1;
  }

  // Batch insert with generated keys
  std::printf("--- Insert ---\n");
  dalpp::Query insert = dalpp::QueryBuilder()
      .ForDefault("INSERT INTO emp(empname, hire_year) VALUES(:name, :year)")
      .Parameter("name", dalpp::ValueType::kText)
      .Parameter("year", dalpp::ValueType::kInt32)
      .Key("empno", dalpp::ValueType::kInt64)
      .Build(&err);
  auto stmt = tx.Prepare(insert, &err);
  if (!err.ok()) {
    std::fprintf(stderr, "Prepare failed: %s\n", err.message);
    return 1;
  }
  const char* names[] = {"Alice", "Bob", "Charlie", "Dana"};
  for (int32_t i = 0; i < 4; ++i) {
    err = stmt.Bind("name", names[i]);
    if (err.ok()) { err = stmt.Bind("year", 2020 + i); }
    if (!err.ok()) {
      std::fprintf(stderr, "Bind failed: %s\n", err.message);
      return 1;
    }
    auto keys = stmt.Insert(&err);
    if (!err.ok() || !keys.Next()) {
      std::fprintf(stderr, "Insert failed: %s\n", err.message);
      return 1;
    }
    std::printf("  %s -> empno %lld\n", names[i],
                static_cast<long long>(keys.GetInt64("empno")));
  }

  // A nested transaction that changes its mind
  {
    auto nested = tx.Transact(&err);
    err = nested.Execute(dalpp::Query::Of("DELETE FROM emp;"));
    std::printf("\nNested delete: %s, rolling back\n",
                err.ok() ? "ok" : err.message);
    err = nested.Rollback();
    if (!err.ok()) {
      std::fprintf(stderr, "Rollback failed: %s\n", err.message);
      return 1;
    }
  }
  err = tx.Commit();
  if (!err.ok()) {
    std::fprintf(stderr, "Commit failed: %s\n", err.message);
    return 1;
  }

  // Engine-specific text with a portable fallback, and a list parameter
  std::printf("\n--- Query ---\n");
  dalpp::Query select = dalpp::QueryBuilder()
      .ForVersion("sqlite", dalpp::VersionPredicate::AtLeast({3, 8}),
                  "SELECT empno, empname, hire_year FROM emp "
                  "WHERE hire_year IN (:years) ORDER BY empno")
      .ForDefault("SELECT empno, empname, hire_year FROM emp "
                  "WHERE hire_year IN (:years)")
      .ParameterList("years", dalpp::ValueType::kInt32, 2)
      .Column("empno", dalpp::ValueType::kInt64)
      .Column("empname", dalpp::ValueType::kText)
      .Column("hire_year", dalpp::ValueType::kInt32)
      .Build(&err);
  auto reader = db.Prepare(select, &err);
  err = reader.BindList("years", {2021, 2023});
  if (!err.ok()) {
    std::fprintf(stderr, "Bind failed: %s\n", err.message);
    return 1;
  }
  auto cursor = reader.Query(&err);
  while (cursor.Next()) {
    std::printf("  empno=%lld  empname=%s  hireYear=%d\n",
                static_cast<long long>(cursor.GetInt64("empno")),
                cursor.GetString("empname").c_str(),
                cursor.GetInt32("hireYear"));
  }

  // Walk the result backwards
  std::printf("\n--- Reverse ---\n");
  cursor = reader.Query(&err);
  if (cursor.Seek(2)) {
    do {
      std::printf("  %s\n", cursor.GetString("empname").c_str());
    } while (cursor.Previous());
  }

  err = db.Close();
  if (!err.ok()) {
    std::fprintf(stderr, "Close failed: %s\n", err.message);
    return 1;
  }
  std::printf("\nDone.\n");
  return 0;
}
