#include <catch2/catch_test_macros.hpp>
#include "db/connection_registry.h"
#include "db/query_executor.h"
#include "db/value.h"
#include "support/temp_db.h"

using namespace sqlscope::db;

TEST_CASE("to_display renders every storage class", "[value]") {
  REQUIRE(to_display(Value{}) == "NULL");
  REQUIRE(to_display(Value{int64_t{-7}}) == "-7");
  REQUIRE(to_display(Value{2.5}) == "2.5");
  REQUIRE(to_display(Value{std::string("hi")}) == "hi");
  const Blob bytes = {0x00, 0xAB, 0x10};
  REQUIRE(to_display(Value{bytes}) == "X'00AB10'");
}

TEST_CASE("value_type follows the variant alternative", "[value]") {
  REQUIRE(value_type(Value{}) == ValueType::Null);
  REQUIRE(value_type(Value{int64_t{1}}) == ValueType::Integer);
  REQUIRE(value_type(Value{1.0}) == ValueType::Real);
  REQUIRE(value_type(Value{std::string()}) == ValueType::Text);
  REQUIRE(value_type(Value{Blob{}}) == ValueType::Blob);
  REQUIRE(std::string(value_type_name(ValueType::Blob)) == "blob");
  REQUIRE(is_null(Value{}));
}

TEST_CASE("read_column keeps storage classes without conversion", "[value]") {
  sqlscope::test::temp_db db("CREATE TABLE v(a, b, c, d, e);"
                             "INSERT INTO v VALUES (NULL, 9007199254740993, 0.1, '12', x'CAFE');");
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto result = executor.run(registry.open(db.path()), "SELECT a, b, c, d, e FROM v");
  REQUIRE(result.ok());
  REQUIRE(result.rows.size() == 1);
  const auto& row = result.rows[0];
  REQUIRE(is_null(row[0]));
  REQUIRE(std::get<int64_t>(row[1]) == 9007199254740993LL);
  REQUIRE(std::get<double>(row[2]) == 0.1);
  REQUIRE(std::get<std::string>(row[3]) == "12");
  const Blob expected = {0xCA, 0xFE};
  REQUIRE(std::get<Blob>(row[4]) == expected);
}
