#include "query_executor.h"
#include <sqlite3.h>
#include <map>
#include <drogon/drogon.h>
#include "schema_inspector.h"

namespace sqlscope::db {

namespace {

std::vector<std::string> unique_column_names(sqlite3_stmt* st, int ncols) {
  std::vector<std::string> names;
  std::map<std::string, int> seen;
  names.reserve(static_cast<size_t>(ncols));
  for (int i = 0; i < ncols; ++i) {
    const char* n = sqlite3_column_name(st, i);
    std::string name = n ? n : "";
    int& count = seen[name];
    ++count;
    if (count > 1) {
      std::string candidate = name + ":" + std::to_string(count);
      while (seen.count(candidate)) candidate = name + ":" + std::to_string(++count);
      seen[candidate] = 1;
      name = std::move(candidate);
    }
    names.push_back(std::move(name));
  }
  return names;
}

QueryResult execute_statement(sqlite3* db, sqlite3_stmt* st) {
  QueryResult result;
  const int ncols = sqlite3_column_count(st);
  const int total_before = sqlite3_total_changes(db);
  if (ncols > 0) {
    result.kind = ResultKind::Rows;
    result.columns = unique_column_names(st, ncols);
  }
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    if (ncols == 0) continue;
    std::vector<Value> row;
    row.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) row.push_back(read_column(st, i));
    result.rows.push_back(std::move(row));
  }
  if (rc != SQLITE_DONE) return QueryResult::failure(sqlite3_errmsg(db));
  if (ncols == 0) {
    // sqlite3_changes() keeps the count of the last DML statement, so only trust it
    // when this statement actually moved the total.
    result.affected_count = sqlite3_total_changes(db) != total_before ? sqlite3_changes(db) : 0;
  }
  return result;
}

}  // namespace

QueryExecutor::QueryExecutor(int default_limit)
    : default_limit_(default_limit > 0 ? default_limit : 1000) {}

QueryResult QueryExecutor::run(Connection& conn, const std::string& sql) const {
  auto lock = conn.guard();
  sqlite3* db = conn.handle();
  if (!db) return QueryResult::failure("Database connection to '" + conn.path() + "' is closed");

  QueryResult result;
  const char* cursor = sql.c_str();
  const char* end = cursor + sql.size();
  while (cursor < end) {
    // sqlite stops reading at a NUL byte, so the tail would never move past it.
    if (*cursor == '\0') return QueryResult::failure("SQL text contains a NUL byte");
    Statement st;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(db, cursor, static_cast<int>(end - cursor), st.out(), &tail) != SQLITE_OK) {
      LOG_DEBUG << "query failed to prepare: " << sqlite3_errmsg(db);
      return QueryResult::failure(sqlite3_errmsg(db));
    }
    cursor = tail ? tail : end;
    if (!st) continue;  // whitespace or comment only
    result = execute_statement(db, st);
    if (!result.ok()) {
      LOG_DEBUG << "query failed: " << *result.error;
      return result;
    }
  }
  return result;
}

QueryResult QueryExecutor::paginate(Connection& conn, const std::string& table, int limit, int offset) const {
  if (limit <= 0) limit = default_limit_;
  if (offset < 0) offset = 0;
  std::string sql = "SELECT * FROM " + inspect::quote_identifier(table) +
                    " LIMIT " + std::to_string(limit) + " OFFSET " + std::to_string(offset);
  return run(conn, sql);
}

}
