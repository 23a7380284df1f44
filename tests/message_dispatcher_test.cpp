#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "db/connection_registry.h"
#include "db/query_executor.h"
#include "service/message_dispatcher.h"
#include "support/temp_db.h"

using sqlscope::db::ConnectionRegistry;
using sqlscope::db::QueryExecutor;
using sqlscope::service::message_dispatcher;
using sqlscope::test::temp_db;

namespace {

const char* kSchema =
    "CREATE TABLE authors(id INTEGER PRIMARY KEY, name TEXT NOT NULL);"
    "CREATE TABLE books(id INTEGER PRIMARY KEY, author_id INTEGER REFERENCES authors(id), title TEXT, cover BLOB);"
    "CREATE INDEX books_by_author ON books(author_id);"
    "INSERT INTO authors(name) VALUES ('Le Guin'), ('Lem');"
    "INSERT INTO books(author_id, title, cover) VALUES (1, 'The Dispossessed', x'0102'), (2, 'Solaris', NULL), (2, 'Fiasco', NULL);";

Json::Value request(const std::string& command, int id) {
  Json::Value r(Json::objectValue);
  r["command"] = command;
  r["requestId"] = id;
  return r;
}

}  // namespace

TEST_CASE("getTables answers with tablesLoaded and echoes requestId", "[dispatcher]") {
  temp_db db(kSchema);
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());

  auto reply = dispatcher.handle(request("getTables", 41));
  REQUIRE(reply["command"].asString() == "tablesLoaded");
  REQUIRE(reply["requestId"].asInt() == 41);
  REQUIRE(reply["tables"].size() == 2);
  REQUIRE(reply["tables"][0]["name"].asString() == "authors");
  REQUIRE(reply["tables"][0]["type"].asString() == "table");
  REQUIRE(reply["tables"][1]["rowCount"].asInt() == 3);
}

TEST_CASE("string requestIds are echoed untouched", "[dispatcher]") {
  temp_db db(kSchema);
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());
  Json::Value r(Json::objectValue);
  r["command"] = "getDatabaseInfo";
  r["requestId"] = "abc-1";
  auto reply = dispatcher.handle(r);
  REQUIRE(reply["command"].asString() == "databaseInfoLoaded");
  REQUIRE(reply["requestId"].asString() == "abc-1");
  REQUIRE(reply["info"]["filename"].asString() == "test.db");
  REQUIRE(reply["info"].isMember("fileSize"));
  REQUIRE(reply["info"].isMember("journal_mode"));
}

TEST_CASE("table level commands carry the table name", "[dispatcher]") {
  temp_db db(kSchema);
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());

  auto info = request("getTableInfo", 1);
  info["tableName"] = "books";
  auto cols = dispatcher.handle(info);
  REQUIRE(cols["command"].asString() == "tableInfoLoaded");
  REQUIRE(cols["tableName"].asString() == "books");
  REQUIRE(cols["columns"].size() == 4);
  REQUIRE(cols["columns"][0]["isPrimaryKey"].asBool());

  auto ix = request("getIndexes", 2);
  ix["tableName"] = "books";
  auto indexes = dispatcher.handle(ix);
  REQUIRE(indexes["command"].asString() == "indexesLoaded");
  REQUIRE(indexes["indexes"][0]["name"].asString() == "books_by_author");
  REQUIRE(indexes["indexes"][0]["columns"][0]["name"].asString() == "author_id");

  auto fk = request("getConstraints", 3);
  fk["tableName"] = "books";
  auto constraints = dispatcher.handle(fk);
  REQUIRE(constraints["command"].asString() == "constraintsLoaded");
  REQUIRE(constraints["constraints"][0]["table"].asString() == "authors");
  REQUIRE(constraints["constraints"][0]["from"].asString() == "author_id");
}

TEST_CASE("getTableData pages and encodes values", "[dispatcher]") {
  temp_db db(kSchema);
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());

  auto r = request("getTableData", 9);
  r["tableName"] = "books";
  r["limit"] = "2";
  r["offset"] = 0;
  auto reply = dispatcher.handle(r);
  REQUIRE(reply["command"].asString() == "tableDataLoaded");
  const auto& result = reply["result"];
  REQUIRE(result["kind"].asString() == "rows");
  REQUIRE(result["rowCount"].asInt() == 2);
  REQUIRE(result["columns"].size() == 4);
  REQUIRE(result["values"][0][2].asString() == "The Dispossessed");
  REQUIRE(result["values"][0][3]["blob"].asString() == "AQI=");
  REQUIRE(result["values"][1][3].isNull());
}

TEST_CASE("executeQuery keeps SQL errors inside the result", "[dispatcher]") {
  temp_db db(kSchema);
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());

  auto bad = request("executeQuery", 5);
  bad["query"] = "SELECT * FROM nowhere";
  auto reply = dispatcher.handle(bad);
  REQUIRE(reply["command"].asString() == "queryExecuted");
  REQUIRE(reply["result"]["kind"].asString() == "error");
  REQUIRE(reply["result"]["error"].asString().find("no such table") != std::string::npos);

  auto update = request("executeQuery", 6);
  update["query"] = "UPDATE books SET title = upper(title) WHERE author_id = 2";
  auto updated = dispatcher.handle(update);
  REQUIRE(updated["result"]["kind"].asString() == "mutation");
  REQUIRE(updated["result"]["affectedCount"].asInt() == 2);
}

TEST_CASE("database failures become error messages", "[dispatcher]") {
  temp_db db(kSchema);
  ConnectionRegistry registry;

  message_dispatcher missing(registry, QueryExecutor(), (db.dir() / "absent.db").string());
  auto unavailable = missing.handle(request("getTables", 1));
  REQUIRE(unavailable["command"].asString() == "error");
  REQUIRE(unavailable["code"].asString() == "E_CONNECTION");
  REQUIRE(unavailable["requestId"].asInt() == 1);

  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());
  auto ddl = request("getTableStructure", 2);
  ddl["tableName"] = "ghost";
  auto not_found = dispatcher.handle(ddl);
  REQUIRE(not_found["code"].asString() == "E_NOT_FOUND");
  REQUIRE(not_found["message"].asString() == "No structure found for ghost");

  auto no_name = dispatcher.handle(request("getTableInfo", 3));
  REQUIRE(no_name["code"].asString() == "E_BAD_REQUEST");

  auto unknown = dispatcher.handle(request("dropEverything", 4));
  REQUIRE(unknown["code"].asString() == "E_BAD_REQUEST");
  REQUIRE(unknown["message"].asString() == "Unknown command: dropEverything");

  auto not_object = dispatcher.handle(Json::Value("getTables"));
  REQUIRE(not_object["command"].asString() == "error");
}

TEST_CASE("getTableStructure formats, falling back to the raw DDL", "[dispatcher]") {
  temp_db db("create table notes(id integer primary key, body text)");
  ConnectionRegistry registry;

  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());
  auto r = request("getTableStructure", 1);
  r["tableName"] = "notes";
  auto formatted = dispatcher.handle(r);
  REQUIRE(formatted["command"].asString() == "tableStructureLoaded");
  REQUIRE(formatted["structure"].asString() == "CREATE TABLE notes (\n  id INTEGER PRIMARY KEY,\n  body TEXT\n)");

  message_dispatcher failing(registry, QueryExecutor(), db.path(),
                             [](const std::string&, const std::string&) -> std::string {
                               throw std::runtime_error("formatter broke");
                             });
  auto raw = failing.handle(r);
  REQUIRE(raw["command"].asString() == "tableStructureLoaded");
  REQUIRE(raw["structure"].asString() == "CREATE TABLE notes(id integer primary key, body text)");
}

TEST_CASE("formatQuery reports formatter failures as formatError", "[dispatcher]") {
  temp_db db;
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());

  auto ok = request("formatQuery", 1);
  ok["query"] = "select 1 from t";
  auto formatted = dispatcher.handle(ok);
  REQUIRE(formatted["command"].asString() == "queryFormatted");
  REQUIRE(formatted["formattedQuery"].asString() == "SELECT 1\nFROM t");
  REQUIRE(formatted["requestId"].asInt() == 1);

  auto bad = request("formatQuery", 2);
  bad["query"] = "select 'oops";
  auto failed = dispatcher.handle(bad);
  REQUIRE(failed["command"].asString() == "formatError");
  REQUIRE(failed["requestId"].asInt() == 2);
  REQUIRE_FALSE(failed["error"].asString().empty());
}

TEST_CASE("refresh messages match the request replies", "[dispatcher]") {
  temp_db db(kSchema);
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());
  auto tables = dispatcher.tables_loaded();
  REQUIRE(tables["command"].asString() == "tablesLoaded");
  REQUIRE_FALSE(tables.isMember("requestId"));
  REQUIRE(dispatcher.database_info_loaded()["command"].asString() == "databaseInfoLoaded");
}

TEST_CASE("out of range paging values are bad requests", "[dispatcher]") {
  temp_db db(kSchema);
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());

  auto huge = request("getTableData", 7);
  huge["tableName"] = "books";
  huge["limit"] = Json::Value(static_cast<Json::UInt64>(3000000000ULL));
  auto reply = dispatcher.handle(huge);
  REQUIRE(reply["command"].asString() == "error");
  REQUIRE(reply["code"].asString() == "E_BAD_REQUEST");
  REQUIRE(reply["requestId"].asInt() == 7);

  huge["limit"] = 1e10;
  REQUIRE(dispatcher.handle(huge)["code"].asString() == "E_BAD_REQUEST");

  huge["limit"] = 10;
  huge["offset"] = "99999999999999999999";
  REQUIRE(dispatcher.handle(huge)["code"].asString() == "E_BAD_REQUEST");

  huge["offset"] = 1.5;
  REQUIRE(dispatcher.handle(huge)["code"].asString() == "E_BAD_REQUEST");
}

TEST_CASE("executeQuery accepts empty text", "[dispatcher]") {
  temp_db db;
  ConnectionRegistry registry;
  message_dispatcher dispatcher(registry, QueryExecutor(), db.path());
  auto r = request("executeQuery", 3);
  r["query"] = "";
  auto reply = dispatcher.handle(r);
  REQUIRE(reply["command"].asString() == "queryExecuted");
  REQUIRE(reply["result"]["kind"].asString() == "mutation");
  REQUIRE(reply["result"]["affectedCount"].asInt() == 0);

  // a missing query is still rejected
  REQUIRE(dispatcher.handle(request("executeQuery", 4))["code"].asString() == "E_BAD_REQUEST");
}
