// Copyright (c) 2024 liudegui. MIT License.
// Tests for the MariaDB backend (requires running MySQL/MariaDB server).
//
// Environment variables:
//   DALPP_MARIA_DSN  -- DSN string, default "localhost:3306:root::dalpp_test"

#include <catch2/catch.hpp>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "dalpp/db.hpp"

using namespace dalpp;

static const char* GetDsn() {
  const char* dsn = std::getenv("DALPP_MARIA_DSN");
  return (dsn != nullptr) ? dsn : "localhost:3306:root::dalpp_test";
}

static MDb OpenTestDb() {
  MDb::OptionsType options;
  options.log = LogSink::Silent();
  MDb db;
  REQUIRE(db.Open(GetDsn(), options).ok());
  auto tx = db.Transact();
  REQUIRE(tx.Execute(Query::Of("DROP TABLE IF EXISTS emp")).ok());
  REQUIRE(tx.Execute(Query::Of(
      "CREATE TABLE emp(empno INT AUTO_INCREMENT PRIMARY KEY, "
      "empname VARCHAR(64), salary DOUBLE, photo BLOB) ENGINE=InnoDB")).ok());
  REQUIRE(tx.Commit().ok());
  return db;
}

static Query InsertQuery() {
  return QueryBuilder()
      .ForDefault("INSERT INTO emp(empname, salary) VALUES(:name, :salary)")
      .Parameter("name", ValueType::kText)
      .Parameter("salary", ValueType::kDouble)
      .Key("empno", ValueType::kInt64)
      .Build();
}

static int64_t CountEmp(MDb& db) {
  Query q = QueryBuilder()
                .ForDefault("SELECT count(*) AS n FROM emp")
                .Column("n", ValueType::kInt64)
                .Build();
  Error err;
  auto stmt = db.Prepare(q, &err);
  REQUIRE(err.ok());
  auto cursor = stmt.Query(&err);
  REQUIRE(err.ok());
  REQUIRE(cursor.Next());
  return cursor.GetInt64("n");
}

TEST_CASE("MariaDb: open and close", "[mariadb]") {
  MDb db;
  REQUIRE_FALSE(db.IsOpen());
  REQUIRE(db.Open(GetDsn()).ok());
  REQUIRE(db.IsOpen());
  REQUIRE(db.Info().type == "mariadb");
  REQUIRE_FALSE(db.Info().version.empty());
  REQUIRE(db.Close().ok());
  REQUIRE_FALSE(db.IsOpen());
}

TEST_CASE("MariaDb: open error", "[mariadb]") {
  MDb db;
  Error err = db.Open("127.0.0.1:1:nobody:wrong:nothing");
  REQUIRE_FALSE(err.ok());
  REQUIRE(err.HasCause());
  REQUIRE_FALSE(db.IsOpen());
}

TEST_CASE("MariaDb: insert returns generated keys", "[mariadb]") {
  auto db = OpenTestDb();
  auto tx = db.Transact();
  Error err;
  auto stmt = tx.Prepare(InsertQuery(), &err);
  REQUIRE(err.ok());

  REQUIRE(stmt.Bind("name", "Alice").ok());
  REQUIRE(stmt.Bind("salary", 1000.5).ok());
  auto keys = stmt.Insert(&err);
  REQUIRE(err.ok());
  REQUIRE(keys.Next());
  int64_t first = keys.GetInt64("empno");
  REQUIRE(first > 0);

  REQUIRE(stmt.Bind("name", "Bob").ok());
  keys = stmt.Insert(&err);
  REQUIRE(keys.Next());
  REQUIRE(keys.GetInt64("empno") == first + 1);
  REQUIRE(tx.Commit().ok());
  REQUIRE(CountEmp(db) == 2);
}

TEST_CASE("MariaDb: query with list parameter", "[mariadb]") {
  auto db = OpenTestDb();
  auto tx = db.Transact();
  Error err;
  auto insert = tx.Prepare(InsertQuery(), &err);
  const char* names[] = {"Alice", "Bob", "Carol"};
  for (const char* name : names) {
    REQUIRE(insert.Bind("name", name).ok());
    REQUIRE(insert.Bind("salary", Value()).ok());
    REQUIRE(insert.Update(&err) == 1);
  }
  REQUIRE(tx.Commit().ok());

  Query q = QueryBuilder()
                .ForDefault("SELECT empname, salary FROM emp "
                            "WHERE empname IN (:names) ORDER BY empname")
                .ParameterList("names", ValueType::kText, 2)
                .Column("empname", ValueType::kText)
                .Column("salary", ValueType::kDouble)
                .Build();
  auto stmt = db.Prepare(q, &err);
  REQUIRE(err.ok());
  REQUIRE(stmt.BindList("names", {"Carol", "Alice"}).ok());
  auto cursor = stmt.Query(&err);
  REQUIRE(err.ok());

  std::vector<std::string> found;
  while (cursor.Next()) {
    found.push_back(cursor.GetString("empname"));
    REQUIRE(cursor.Get("salary").IsNull());
  }
  REQUIRE(found == std::vector<std::string>({"Alice", "Carol"}));
}

TEST_CASE("MariaDb: cursor seeks backwards", "[mariadb]") {
  auto db = OpenTestDb();
  auto tx = db.Transact();
  REQUIRE(tx.Execute(Query::Of(
      "INSERT INTO emp(empname, salary) VALUES('A', 1), ('B', 2), ('C', 3)"))
              .ok());
  REQUIRE(tx.Commit().ok());

  Query q = QueryBuilder()
                .ForDefault("SELECT salary FROM emp ORDER BY salary")
                .Column("salary", ValueType::kDouble)
                .Build();
  Error err;
  auto stmt = db.Prepare(q, &err);
  auto cursor = stmt.Query(&err);
  REQUIRE(cursor.Seek(3));
  REQUIRE(cursor.GetDouble("salary") == Catch::Detail::Approx(3.0));
  REQUIRE(cursor.Seek(-2));
  REQUIRE(cursor.GetDouble("salary") == Catch::Detail::Approx(1.0));
  REQUIRE_FALSE(cursor.Seek(5));
}

TEST_CASE("MariaDb: blob round trip", "[mariadb]") {
  auto db = OpenTestDb();
  auto tx = db.Transact();
  Query insert = QueryBuilder()
                     .ForDefault("INSERT INTO emp(empname, photo) "
                                 "VALUES('pic', :photo)")
                     .Parameter("photo", ValueType::kBlob)
                     .Build();
  const uint8_t bytes[] = {0x00, 0x7F, 0xFF, 0x00};
  Error err;
  auto stmt = tx.Prepare(insert, &err);
  REQUIRE(stmt.Bind("photo", Value::Blob(bytes, sizeof(bytes))).ok());
  REQUIRE(stmt.Update(&err) == 1);
  REQUIRE(tx.Commit().ok());

  Query select = QueryBuilder()
                     .ForDefault("SELECT photo FROM emp WHERE empname = 'pic'")
                     .Column("photo", ValueType::kBlob)
                     .Build();
  auto reader = db.Prepare(select, &err);
  auto cursor = reader.Query(&err);
  REQUIRE(cursor.Next());
  REQUIRE(cursor.GetBlob("photo") ==
          std::vector<uint8_t>(bytes, bytes + sizeof(bytes)));
}

TEST_CASE("MariaDb: nested transactions use savepoints", "[mariadb]") {
  auto db = OpenTestDb();
  auto tx = db.Transact();
  Error err;
  auto insert = tx.Prepare(InsertQuery(), &err);
  REQUIRE(insert.Bind("name", "kept").ok());
  REQUIRE(insert.Update(&err) == 1);

  auto nested = tx.Transact(&err);
  REQUIRE(err.ok());
  REQUIRE(nested.Execute(Query::Of(
      "INSERT INTO emp(empname) VALUES('discarded')")).ok());
  REQUIRE(nested.Rollback().ok());

  REQUIRE(tx.Commit().ok());
  REQUIRE(CountEmp(db) == 1);
}

TEST_CASE("MariaDb: variant selection by engine", "[mariadb]") {
  auto db = OpenTestDb();
  Query q = QueryBuilder()
                .ForType("sqlite", "SELECT 'sqlite' AS engine")
                .ForType("mariadb", "SELECT 'mariadb' AS engine")
                .Column("engine", ValueType::kText)
                .Build();
  Error err;
  auto stmt = db.Prepare(q, &err);
  REQUIRE(err.ok());
  auto cursor = stmt.Query(&err);
  REQUIRE(cursor.Next());
  REQUIRE(cursor.GetString("engine") == "mariadb");
}
