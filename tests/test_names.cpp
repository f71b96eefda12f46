// Copyright (c) 2024 liudegui. MIT License.
// Tests for column name normalization.

#include <catch2/catch.hpp>
#include <string>

#include "dalpp/names.hpp"

using namespace dalpp;

TEST_CASE("Names: ToLower", "[names]") {
  REQUIRE(ToLower("EmpName") == "empname");
  REQUIRE(ToLower("already_lower_1") == "already_lower_1");
}

TEST_CASE("Names: SnakeToCamel", "[names]") {
  REQUIRE(SnakeToCamel("first_name") == "firstName");
  REQUIRE(SnakeToCamel("a_b_c") == "aBC");
  REQUIRE(SnakeToCamel("empno") == "empno");
  REQUIRE(SnakeToCamel("_leading") == "leading");
  REQUIRE(SnakeToCamel("double__under") == "doubleUnder");
  REQUIRE(SnakeToCamel("trailing_") == "trailing");
}

TEST_CASE("Names: UnquoteColumnName", "[names]") {
  REQUIRE(UnquoteColumnName("\"Mixed Case\"") == "Mixed Case");
  REQUIRE(UnquoteColumnName("\"say \"\"hi\"\"\"") == "say \"hi\"");
  REQUIRE(UnquoteColumnName("plain") == "plain");
  REQUIRE(UnquoteColumnName("\"") == "\"");
}

TEST_CASE("Names: default mapper is snake to camel", "[names]") {
  ColumnNameMapper mapper = DefaultColumnNameMapper();
  REQUIRE(mapper("order_id") == "orderId");
}
