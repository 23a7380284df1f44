#pragma once
#include <string>
#include "connection.h"
#include "descriptors.h"

namespace sqlscope::db {

class QueryExecutor {
 public:
  explicit QueryExecutor(int default_limit = 1000);

  // Executes arbitrary SQL text. SQL-level failures come back in QueryResult::error,
  // never as exceptions. With several statements the result describes the last one
  // executed; execution stops at the first failing statement.
  QueryResult run(Connection& conn, const std::string& sql) const;

  // SELECT * FROM <table> LIMIT <limit> OFFSET <offset>. limit <= 0 uses the default.
  QueryResult paginate(Connection& conn, const std::string& table, int limit = 0, int offset = 0) const;

  int default_limit() const { return default_limit_; }

 private:
  int default_limit_;
};

}
