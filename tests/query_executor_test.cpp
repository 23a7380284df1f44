#include <catch2/catch_test_macros.hpp>
#include "db/connection_registry.h"
#include "db/query_executor.h"
#include "support/temp_db.h"

using namespace sqlscope::db;
using sqlscope::test::temp_db;

TEST_CASE("SELECT 1 yields one column and one row", "[query]") {
  temp_db db;
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto r = executor.run(registry.open(db.path()), "SELECT 1");
  REQUIRE(r.ok());
  REQUIRE(r.kind == ResultKind::Rows);
  REQUIRE(r.columns.size() == 1);
  REQUIRE(r.columns[0] == "1");
  REQUIRE(r.rows.size() == 1);
  REQUIRE(std::get<int64_t>(r.rows[0][0]) == 1);
}

TEST_CASE("create, insert and select round through run", "[query]") {
  temp_db db;
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto& conn = registry.open(db.path());

  auto created = executor.run(conn, "CREATE TABLE t(x INTEGER)");
  REQUIRE(created.ok());
  REQUIRE(created.kind == ResultKind::Mutation);
  REQUIRE(created.affected_count == 0);

  auto inserted = executor.run(conn, "INSERT INTO t VALUES (1),(2)");
  REQUIRE(inserted.ok());
  REQUIRE(inserted.kind == ResultKind::Mutation);
  REQUIRE(inserted.columns.empty());
  REQUIRE(inserted.affected_count == 2);

  auto selected = executor.run(conn, "SELECT * FROM t");
  REQUIRE(selected.ok());
  REQUIRE(selected.columns == std::vector<std::string>(1, "x"));
  REQUIRE(selected.rows.size() == 2);
  REQUIRE(std::get<int64_t>(selected.rows[0][0]) == 1);
  REQUIRE(std::get<int64_t>(selected.rows[1][0]) == 2);

  // DDL after DML must not report the previous statement's change count
  auto dropped = executor.run(conn, "CREATE TABLE u(y)");
  REQUIRE(dropped.affected_count == 0);
}

TEST_CASE("zero-row SELECT is distinct from a mutation", "[query]") {
  temp_db db("CREATE TABLE t(a, b);");
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto r = executor.run(registry.open(db.path()), "SELECT a, b FROM t WHERE 0");
  REQUIRE(r.ok());
  REQUIRE(r.has_rows());
  REQUIRE(r.columns.size() == 2);
  REQUIRE(r.rows.empty());
}

TEST_CASE("errors come back as data", "[query]") {
  temp_db db;
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto& conn = registry.open(db.path());

  auto r = executor.run(conn, "SELECT * FROM nonexistent");
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.error->find("no such table") != std::string::npos);
  REQUIRE(r.rows.empty());
  REQUIRE(r.columns.empty());

  auto constraint = executor.run(conn, "CREATE TABLE k(id PRIMARY KEY); INSERT INTO k VALUES (1); INSERT INTO k VALUES (1)");
  REQUIRE_FALSE(constraint.ok());
  REQUIRE(constraint.error->find("UNIQUE") != std::string::npos);
}

TEST_CASE("multi-statement text reports the last statement", "[query]") {
  temp_db db;
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto& conn = registry.open(db.path());

  auto r = executor.run(conn, "CREATE TABLE m(v); INSERT INTO m VALUES (1),(2),(3); SELECT count(*) AS n FROM m;");
  REQUIRE(r.ok());
  REQUIRE(r.columns == std::vector<std::string>(1, "n"));
  REQUIRE(std::get<int64_t>(r.rows[0][0]) == 3);

  // execution stops at the first failure
  auto failed = executor.run(conn, "INSERT INTO m VALUES (4); SELECT * FROM nope; INSERT INTO m VALUES (5);");
  REQUIRE_FALSE(failed.ok());
  auto count = executor.run(conn, "SELECT count(*) FROM m");
  REQUIRE(std::get<int64_t>(count.rows[0][0]) == 4);
}

TEST_CASE("empty and comment-only text is an empty mutation", "[query]") {
  temp_db db;
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto& conn = registry.open(db.path());
  for (const char* sql : {"", "   \n", "-- nothing here", "/* still nothing */ ;"}) {
    auto r = executor.run(conn, sql);
    REQUIRE(r.ok());
    REQUIRE(r.kind == ResultKind::Mutation);
    REQUIRE(r.affected_count == 0);
  }
}

TEST_CASE("duplicate column names are made unique", "[query]") {
  temp_db db;
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto r = executor.run(registry.open(db.path()), "SELECT 1 AS a, 2 AS a, 3 AS b, 4 AS a");
  REQUIRE(r.ok());
  const std::vector<std::string> expected = {"a", "a:2", "b", "a:3"};
  REQUIRE(r.columns == expected);
  REQUIRE(r.rows[0].size() == r.columns.size());
}

TEST_CASE("paginate returns the requested window", "[query]") {
  temp_db db("CREATE TABLE t(x INTEGER); INSERT INTO t VALUES (1),(2);");
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto& conn = registry.open(db.path());

  auto second = executor.paginate(conn, "t", 1, 1);
  REQUIRE(second.ok());
  REQUIRE(second.rows.size() == 1);
  REQUIRE(std::get<int64_t>(second.rows[0][0]) == 2);

  // non-positive limit falls back to the default, negative offset to zero
  auto all = executor.paginate(conn, "t", 0, -5);
  REQUIRE(all.rows.size() == 2);

  QueryExecutor small(1);
  REQUIRE(small.paginate(conn, "t").rows.size() == 1);
}

TEST_CASE("paginate quotes table names", "[query]") {
  temp_db db("CREATE TABLE \"weird \"\"t\"\"\"(v); INSERT INTO \"weird \"\"t\"\"\" VALUES ('ok');");
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto r = executor.paginate(registry.open(db.path()), "weird \"t\"", 10, 0);
  REQUIRE(r.ok());
  REQUIRE(std::get<std::string>(r.rows.at(0).at(0)) == "ok");

  auto missing = executor.paginate(registry.open(db.path()), "absent", 10, 0);
  REQUIRE_FALSE(missing.ok());
}

TEST_CASE("run on a closed connection reports an error", "[query]") {
  temp_db db;
  auto conn = Connection::open(db.path());
  conn->close();
  QueryExecutor executor;
  auto r = executor.run(*conn, "SELECT 1");
  REQUIRE_FALSE(r.ok());
}

TEST_CASE("a NUL byte in the text ends execution with an error", "[query]") {
  temp_db db("CREATE TABLE t(x); INSERT INTO t VALUES (1);");
  ConnectionRegistry registry;
  QueryExecutor executor;
  auto& conn = registry.open(db.path());

  auto r = executor.run(conn, std::string("SELECT 1;\0SELECT 2", 18));
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.error->find("NUL") != std::string::npos);

  auto leading = executor.run(conn, std::string("\0DELETE FROM t", 14));
  REQUIRE_FALSE(leading.ok());

  // the connection is still usable afterwards
  auto count = executor.run(conn, "SELECT count(*) FROM t");
  REQUIRE(count.ok());
  REQUIRE(std::get<int64_t>(count.rows[0][0]) == 1);
}
