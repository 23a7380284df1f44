#include "message_dispatcher.h"
#include <stdexcept>
#include <drogon/drogon.h>
#include "db/errors.h"
#include "db/schema_inspector.h"
#include "json_codec.h"
#include "utils/limits.h"
#include "utils/sql_format.h"

namespace sqlscope::service {

namespace {

class bad_request : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

std::string require_string(const Json::Value& request, const char* field, bool allow_empty = false) {
  const Json::Value& v = request[field];
  if (!v.isString() || (!allow_empty && v.asString().empty())) {
    throw bad_request(std::string("Missing '") + field + "'");
  }
  return v.asString();
}

int optional_int(const Json::Value& request, const char* field, int fallback) {
  const Json::Value& v = request[field];
  if (v.isNull()) return fallback;
  if (v.isInt()) return v.asInt();
  if (v.isIntegral()) throw bad_request(std::string("'") + field + "' is out of range");
  if (v.isString()) {
    try {
      return std::stoi(v.asString());
    } catch (const std::out_of_range&) {
      throw bad_request(std::string("'") + field + "' is out of range");
    } catch (const std::invalid_argument&) {
      throw bad_request(std::string("'") + field + "' must be an integer");
    }
  }
  throw bad_request(std::string("'") + field + "' must be an integer");
}

}  // namespace

Json::Value error_message(const std::string& code, const std::string& message, const Json::Value& request_id) {
  Json::Value out(Json::objectValue);
  out["command"] = "error";
  out["code"] = code;
  out["message"] = message;
  if (!request_id.isNull()) out["requestId"] = request_id;
  return out;
}

message_dispatcher::message_dispatcher(db::ConnectionRegistry& registry,
                                       db::QueryExecutor executor,
                                       std::string db_path,
                                       formatter_fn formatter)
    : registry_(registry),
      executor_(std::move(executor)),
      db_path_(std::move(db_path)),
      formatter_(formatter ? std::move(formatter)
                           : formatter_fn([](const std::string& sql, const std::string& dialect) {
                               return sqlfmt::format(sql, dialect);
                             })) {}

db::Connection& message_dispatcher::connection() const {
  return registry_.open(db_path_);
}

std::string message_dispatcher::format_or_original(const std::string& sql) const {
  try {
    return formatter_(sql, "sqlite");
  } catch (const std::exception& e) {
    LOG_WARN << "Error formatting SQL: " << e.what();
    return sql;
  }
}

Json::Value message_dispatcher::handle(const Json::Value& request) const {
  Json::Value request_id = request.isObject() ? request["requestId"] : Json::Value();
  if (!request.isObject() || !request["command"].isString()) {
    return error_message("E_BAD_REQUEST", "Missing 'command'", request_id);
  }
  const std::string command = request["command"].asString();
  try {
    Json::Value out = dispatch(command, request);
    if (!request_id.isNull()) out["requestId"] = request_id;
    return out;
  } catch (const bad_request& e) {
    return error_message("E_BAD_REQUEST", e.what(), request_id);
  } catch (const db::connection_error& e) {
    LOG_ERROR << command << ": " << e.what();
    return error_message("E_CONNECTION", e.what(), request_id);
  } catch (const db::not_found_error& e) {
    return error_message("E_NOT_FOUND", e.what(), request_id);
  } catch (const db::schema_error& e) {
    LOG_ERROR << command << ": " << e.what();
    return error_message("E_SCHEMA", e.what(), request_id);
  } catch (const std::exception& e) {
    LOG_ERROR << command << " failed: " << e.what();
    return error_message("E_INTERNAL", e.what(), request_id);
  }
}

Json::Value message_dispatcher::tables_loaded() const {
  Json::Value out(Json::objectValue);
  out["command"] = "tablesLoaded";
  out["tables"] = to_json_array(db::inspect::list_tables(connection()));
  return out;
}

Json::Value message_dispatcher::database_info_loaded() const {
  Json::Value out(Json::objectValue);
  out["command"] = "databaseInfoLoaded";
  out["info"] = to_json(db::inspect::database_info(connection(), db_path_));
  return out;
}

Json::Value message_dispatcher::dispatch(const std::string& command, const Json::Value& request) const {
  if (command == "getTables") return tables_loaded();
  if (command == "getDatabaseInfo") return database_info_loaded();

  Json::Value out(Json::objectValue);
  if (command == "getTableInfo") {
    auto table = require_string(request, "tableName");
    out["command"] = "tableInfoLoaded";
    out["tableName"] = table;
    out["columns"] = to_json_array(db::inspect::columns(connection(), table));
    return out;
  }
  if (command == "getTableData") {
    auto table = require_string(request, "tableName");
    int limit = optional_int(request, "limit", 0);
    int offset = optional_int(request, "offset", 0);
    if (limit > SQLSCOPE_MAX_ROW_LIMIT) limit = SQLSCOPE_MAX_ROW_LIMIT;
    out["command"] = "tableDataLoaded";
    out["tableName"] = table;
    out["result"] = to_json(executor_.paginate(connection(), table, limit, offset));
    return out;
  }
  if (command == "executeQuery") {
    // empty text is a valid no-op statement list
    auto query = require_string(request, "query", true);
    out["command"] = "queryExecuted";
    out["result"] = to_json(executor_.run(connection(), query));
    return out;
  }
  if (command == "getTableStructure") {
    auto table = require_string(request, "tableName");
    out["command"] = "tableStructureLoaded";
    out["tableName"] = table;
    out["structure"] = format_or_original(db::inspect::ddl(connection(), table));
    return out;
  }
  if (command == "getIndexes") {
    auto table = require_string(request, "tableName");
    out["command"] = "indexesLoaded";
    out["tableName"] = table;
    out["indexes"] = to_json_array(db::inspect::indexes(connection(), table));
    return out;
  }
  if (command == "getConstraints") {
    auto table = require_string(request, "tableName");
    out["command"] = "constraintsLoaded";
    out["tableName"] = table;
    out["constraints"] = to_json_array(db::inspect::foreign_keys(connection(), table));
    return out;
  }
  if (command == "formatQuery") {
    auto query = require_string(request, "query");
    try {
      out["command"] = "queryFormatted";
      out["formattedQuery"] = formatter_(query, "sqlite");
    } catch (const std::exception& e) {
      out = Json::Value(Json::objectValue);
      out["command"] = "formatError";
      out["error"] = e.what();
    }
    return out;
  }
  throw bad_request("Unknown command: " + command);
}

}
