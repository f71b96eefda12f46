// Copyright (c) 2024 liudegui. MIT License.
// Tests for dalpp::Query, dalpp::QueryBuilder and variant selection.

#include <catch2/catch.hpp>
#include <cstring>
#include <string>
#include <vector>

#include "dalpp/query.hpp"

using namespace dalpp;

static DatabaseInfo Info(const char* type, const char* version) {
  DatabaseInfo info;
  info.type = type;
  info.version = version;
  return info;
}

static std::string ResolveSql(const Query& q, const DatabaseInfo& info) {
  QueryDescriptor d;
  Error err = q.Resolve(info, &d);
  REQUIRE(err.ok());
  return d.Sql();
}

// ---------------------------------------------------------------------------
// VersionPredicate
// ---------------------------------------------------------------------------

TEST_CASE("VersionPredicate: minimum compares each component",
          "[query]") {
  VersionPredicate p = VersionPredicate::AtLeast({2, 0});
  REQUIRE(p.Matches("2.5"));
  REQUIRE(p.Matches("2.0"));
  REQUIRE(p.Matches("3.1.4"));
  REQUIRE_FALSE(p.Matches("1.0"));
  REQUIRE_FALSE(p.Matches("x.y"));
}

TEST_CASE("VersionPredicate: missing components are not compared",
          "[query]") {
  REQUIRE(VersionPredicate::AtLeast({2, 0}).Matches("2"));
  REQUIRE(VersionPredicate::AtLeast({2, 5, 1}).Matches("3"));
  REQUIRE_FALSE(VersionPredicate::AtLeast({3, 0}).Matches("2"));
  REQUIRE_FALSE(VersionPredicate::AtLeast({2, 0}).Matches("2."));
}

TEST_CASE("VersionPredicate: pattern searches the version", "[query]") {
  VersionPredicate p = VersionPredicate::Matching("^3\\.(3[5-9]|4[0-9])");
  REQUIRE(p.Valid());
  REQUIRE(p.Matches("3.45.1"));
  REQUIRE_FALSE(p.Matches("3.22.0"));
  REQUIRE(VersionPredicate::Any().Matches("anything"));
}

TEST_CASE("VersionPredicate: invalid pattern is reported", "[query]") {
  VersionPredicate p = VersionPredicate::Matching("(unclosed");
  REQUIRE_FALSE(p.Valid());
  REQUIRE_FALSE(p.Matches("1.0"));

  Error err;
  Query q = QueryBuilder().ForVersion("sqlite", p, "SELECT 1").Build(&err);
  REQUIRE(err.code == ErrorCode::kParse);
  REQUIRE_FALSE(q.Valid());
}

// ---------------------------------------------------------------------------
// Variant selection
// ---------------------------------------------------------------------------

TEST_CASE("Query: first matching variant wins, default otherwise", "[query]") {
  Error err;
  Query q = QueryBuilder()
                .ForVersion("A", VersionPredicate::AtLeast({2, 0}), "Q1")
                .ForDefault("Q2")
                .Build(&err);
  REQUIRE(err.ok());

  REQUIRE(ResolveSql(q, Info("A", "2.5")) == "Q1");
  REQUIRE(ResolveSql(q, Info("B", "2.5")) == "Q2");
  REQUIRE(ResolveSql(q, Info("A", "1.0")) == "Q2");
}

TEST_CASE("Query: variants are tried in declaration order", "[query]") {
  Query q = QueryBuilder()
                .ForType("A", "FIRST")
                .ForVersion("A", VersionPredicate::AtLeast({1}), "SECOND")
                .Build();
  REQUIRE(ResolveSql(q, Info("A", "9")) == "FIRST");
}

TEST_CASE("Query: no applicable variant", "[query]") {
  Query q = QueryBuilder().ForType("A", "SELECT 1").Build();
  REQUIRE(q.Valid());

  QueryDescriptor d;
  Error err = q.Resolve(Info("B", "1.0"), &d);
  REQUIRE(err.code == ErrorCode::kNoVariant);
  REQUIRE(std::strstr(err.message, "No applicable query variant found") !=
          nullptr);
}

TEST_CASE("Query: builder without text fails", "[query]") {
  Error err;
  Query q = QueryBuilder().Parameter("a", ValueType::kInt32).Build(&err);
  REQUIRE(err.code == ErrorCode::kNoVariant);
  REQUIRE_FALSE(q.Valid());
}

TEST_CASE("Query: malformed text fails at build time", "[query]") {
  Error err;
  Query q = QueryBuilder()
                .ForType("A", "SELECT :ok")
                .ForDefault("SELECT ?")
                .Build(&err);
  REQUIRE(err.code == ErrorCode::kParse);
  REQUIRE_FALSE(q.Valid());
}

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

TEST_CASE("Query: names are case-insensitive", "[query]") {
  Query q = QueryBuilder()
                .ForDefault("SELECT EmpName FROM emp WHERE EmpNo = :EmpNo")
                .Parameter("EMPNO", ValueType::kInt64)
                .Column("EmpName", ValueType::kText)
                .Build();
  REQUIRE(q.Valid());
  REQUIRE(q.Declarations().parameters.at("empno") == ValueType::kInt64);
  REQUIRE(q.Declarations().columns.at("empname") == ValueType::kText);

  QueryDescriptor d;
  REQUIRE(q.Resolve(Info("sqlite", "3.45.0"), &d).ok());
  REQUIRE(d.IndicesOf("empno") != nullptr);
  REQUIRE(*d.IndicesOf("empno") == std::vector<int32_t>({0}));
}

TEST_CASE("Query: conflicting declarations", "[query]") {
  Error err;
  Query q = QueryBuilder()
                .ForDefault("SELECT :id")
                .Parameter("id", ValueType::kInt32)
                .Parameter("ID", ValueType::kText)
                .Build(&err);
  REQUIRE(err.code == ErrorCode::kTypeConflict);
  REQUIRE(std::strstr(err.message,
                      "Multiple different types are defined for parameter") !=
          nullptr);
  REQUIRE_FALSE(q.Valid());

  // Re-declaring with the same type is fine
  q = QueryBuilder()
          .ForDefault("SELECT :id")
          .Parameter("id", ValueType::kInt32)
          .Parameter("id", ValueType::kInt32)
          .Build(&err);
  REQUIRE(err.ok());
}

TEST_CASE("Query: list parameter declares its elements", "[query]") {
  Query q = QueryBuilder()
                .ForDefault("SELECT * FROM t WHERE id IN (:ids)")
                .ParameterList("ids", ValueType::kInt64, 3)
                .Build();
  REQUIRE(q.Valid());
  const QueryDeclarations& decls = q.Declarations();
  REQUIRE(decls.list_sizes.at("ids") == 3);
  REQUIRE(decls.parameters.at("ids[0]") == ValueType::kInt64);
  REQUIRE(decls.parameters.at("ids[2]") == ValueType::kInt64);

  QueryDescriptor d;
  REQUIRE(q.Resolve(Info("sqlite", "3"), &d).ok());
  REQUIRE(d.Sql() == "SELECT * FROM t WHERE id IN (?, ?, ?)");
}

TEST_CASE("Query: list size must be positive", "[query]") {
  Error err;
  QueryBuilder()
      .ForDefault("SELECT :ids")
      .ParameterList("ids", ValueType::kInt64, 0)
      .Build(&err);
  REQUIRE(err.code == ErrorCode::kRange);
}

// ---------------------------------------------------------------------------
// Composition
// ---------------------------------------------------------------------------

TEST_CASE("Query: concat numbers parameters across fragments", "[query]") {
  Query select = Query::Of("SELECT * FROM emp WHERE empno = :no",
                           {{"no", ValueType::kInt64}}, {});
  Query filter = Query::Of(" AND (empname = :name OR :no = 0)",
                           {{"name", ValueType::kText}}, {});
  Error err;
  Query q = Query::Concat({select, filter}, &err);
  REQUIRE(err.ok());

  QueryDescriptor d;
  REQUIRE(q.Resolve(Info("sqlite", "3.45.0"), &d).ok());
  REQUIRE(d.Sql() ==
          "SELECT * FROM emp WHERE empno = ? AND (empname = ? OR ? = 0)");
  REQUIRE(*d.IndicesOf("no") == std::vector<int32_t>({0, 2}));
  REQUIRE(*d.IndicesOf("name") == std::vector<int32_t>({1}));
  REQUIRE(d.Parameters().size() == 2);
}

TEST_CASE("Query: concat with conflicting fragment types", "[query]") {
  Query a = Query::Of("SELECT :x", {{"x", ValueType::kInt32}}, {});
  Query b = Query::Of(" + :x", {{"x", ValueType::kText}}, {});
  Error err;
  Query q = Query::Concat({a, b}, &err);
  REQUIRE(err.code == ErrorCode::kTypeConflict);
  REQUIRE_FALSE(q.Valid());
}

TEST_CASE("Query: fragments keep their own variants", "[query]") {
  Query limit = QueryBuilder()
                    .ForType("mariadb", " LIMIT 1")
                    .ForDefault(" LIMIT :n")
                    .Parameter("n", ValueType::kInt32)
                    .Build();
  Query q = Query::Concat({Query::Of("SELECT * FROM t"), limit});
  REQUIRE(ResolveSql(q, Info("mariadb", "10.11")) == "SELECT * FROM t LIMIT 1");
  REQUIRE(ResolveSql(q, Info("sqlite", "3.45")) == "SELECT * FROM t LIMIT ?");
}

TEST_CASE("Query: format substitutes arguments", "[query]") {
  Query fmt = Query::Of("SELECT %s FROM emp WHERE %s AND pct > 50%%");
  Query cols = Query::Of("empname");
  Query cond = Query::Of("empno = :no", {{"no", ValueType::kInt64}}, {});
  Error err;
  Query q = Query::Format(fmt, {cols, cond}, &err);
  REQUIRE(err.ok());

  QueryDescriptor d;
  REQUIRE(q.Resolve(Info("sqlite", "3"), &d).ok());
  REQUIRE(d.Sql() == "SELECT empname FROM emp WHERE empno = ? AND pct > 50%");
  REQUIRE(*d.IndicesOf("no") == std::vector<int32_t>({0}));
}

TEST_CASE("Query: format with too few arguments", "[query]") {
  Query q = Query::Format(Query::Of("SELECT %s, %s"), {Query::Of("1")});
  QueryDescriptor d;
  REQUIRE(q.Resolve(Info("sqlite", "3"), &d).code == ErrorCode::kMisuse);
}

TEST_CASE("Query: uninitialized query", "[query]") {
  Query q;
  REQUIRE_FALSE(q.Valid());
  QueryDescriptor d;
  REQUIRE(q.Resolve(Info("sqlite", "3"), &d).code == ErrorCode::kMisuse);

  Error err;
  Query c = Query::Concat({q}, &err);
  REQUIRE(err.code == ErrorCode::kMisuse);
  REQUIRE_FALSE(c.Valid());
}
