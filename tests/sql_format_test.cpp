#include <catch2/catch_test_macros.hpp>
#include "utils/sql_format.h"

using sqlscope::sqlfmt::format;
using sqlscope::sqlfmt::format_error;

TEST_CASE("clauses start their own line", "[sqlfmt]") {
  REQUIRE(format("select a, b from t where x = 1") == "SELECT a, b\nFROM t\nWHERE x = 1");
  REQUIRE(format("update t set a = 1 where b = 2") == "UPDATE t\nSET a = 1\nWHERE b = 2");
  REQUIRE(format("insert into t values (1, 'a')") == "INSERT INTO t\nVALUES (1, 'a')");
}

TEST_CASE("joins break before the modifier only", "[sqlfmt]") {
  REQUIRE(format("select * from a left join b on a.id = b.id") ==
          "SELECT *\nFROM a\nLEFT JOIN b ON a.id = b.id");
}

TEST_CASE("create table lists one column per line", "[sqlfmt]") {
  REQUIRE(format("create table t(id integer primary key, name text not null)") ==
          "CREATE TABLE t (\n  id INTEGER PRIMARY KEY,\n  name TEXT NOT NULL\n)");
}

TEST_CASE("calls, unary minus and subqueries stay compact", "[sqlfmt]") {
  REQUIRE(format("select count(*) from t") == "SELECT count(*)\nFROM t");
  REQUIRE(format("select * from t where id = -1") == "SELECT *\nFROM t\nWHERE id = -1");
  REQUIRE(format("select * from (select 1)") == "SELECT *\nFROM (SELECT 1)");
}

TEST_CASE("literals and quoted identifiers are left alone", "[sqlfmt]") {
  REQUIRE(format("select 'from x'") == "SELECT 'from x'");
  REQUIRE(format("select \"from\" from t") == "SELECT \"from\"\nFROM t");
  REQUIRE(format("select 'it''s'") == "SELECT 'it''s'");
}

TEST_CASE("statements are separated", "[sqlfmt]") {
  REQUIRE(format("select 1; select 2") == "SELECT 1;\nSELECT 2");
}

TEST_CASE("bad input throws format_error", "[sqlfmt]") {
  REQUIRE_THROWS_AS(format("select 'abc"), format_error);
  REQUIRE_THROWS_AS(format("select \"abc"), format_error);
  REQUIRE_THROWS_AS(format("select 1 /* open"), format_error);
  REQUIRE_THROWS_AS(format("select 1", "mysql"), format_error);
}
