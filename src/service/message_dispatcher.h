#pragma once
#include <functional>
#include <string>
#include <json/json.h>
#include "db/connection_registry.h"
#include "db/query_executor.h"

namespace sqlscope::service {

// Pretty-printer collaborator: (sql, dialect) -> formatted sql, throws on failure.
using formatter_fn = std::function<std::string(const std::string&, const std::string&)>;

// Serves the request/response message protocol for one database file.
//
// Requests look like { "command": "getTableData", "requestId": 7, "tableName": "t", ... }.
// Every request gets exactly one response object echoing its requestId. Failures of
// the database layer come back as { "command": "error", "code", "message" }; query
// failures stay inside the queryExecuted result.
class message_dispatcher {
 public:
  message_dispatcher(db::ConnectionRegistry& registry,
                     db::QueryExecutor executor,
                     std::string db_path,
                     formatter_fn formatter = formatter_fn());

  Json::Value handle(const Json::Value& request) const;

  // Unsolicited refresh messages (same shape as the getTables/getDatabaseInfo replies).
  Json::Value tables_loaded() const;
  Json::Value database_info_loaded() const;

  const std::string& db_path() const { return db_path_; }

 private:
  Json::Value dispatch(const std::string& command, const Json::Value& request) const;
  db::Connection& connection() const;
  std::string format_or_original(const std::string& sql) const;

  db::ConnectionRegistry& registry_;
  db::QueryExecutor executor_;
  std::string db_path_;
  formatter_fn formatter_;
};

// Error reply in protocol shape.
Json::Value error_message(const std::string& code, const std::string& message, const Json::Value& request_id);

}
