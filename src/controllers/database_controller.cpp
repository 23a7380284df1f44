#include "database_controller.h"
#include <drogon/drogon.h>
#include <string>
#include "app/app_context.h"
#include "controllers/events_controller.h"
#include "utils/json_response.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;
using drogon::HttpStatusCode;

namespace sqlscope::controllers {

namespace {

// Runs one protocol request on the worker pool and answers with the standard envelope,
// using `field` of the reply as the data payload.
void respond(Json::Value request, std::string field, database_controller::callback&& cb) {
  auto& context = sqlscope::app::app_context::instance();
  context.post([request = std::move(request), field = std::move(field), cb = std::move(cb)]() {
    auto reply = sqlscope::app::app_context::instance().dispatcher().handle(request);
    const std::string command = reply["command"].asString();
    if (command == "error") return cb(sqlscope::http::from_error_message(reply));
    if (command == "formatError") {
      return cb(sqlscope::http::error(sqlscope::http::status_for_code("E_FORMAT"), "E_FORMAT", reply["error"].asString()));
    }
    cb(sqlscope::http::ok(reply[field]));
  });
}

Json::Value table_request(const char* command, const std::string& table) {
  Json::Value request(Json::objectValue);
  request["command"] = command;
  request["tableName"] = table;
  return request;
}

// Body must be a JSON object with a non-empty string `query`.
bool query_request(const HttpRequestPtr& req, const char* command, Json::Value& out) {
  auto body = req->getJsonObject();
  if (!body || !(*body)["query"].isString()) return false;
  out = Json::Value(Json::objectValue);
  out["command"] = command;
  out["query"] = (*body)["query"];
  return true;
}

}  // namespace

void database_controller::post_message(const HttpRequestPtr& req, callback&& cb) {
  auto body = req->getJsonObject();
  if (!body) {
    return cb(sqlscope::http::error(HttpStatusCode::k400BadRequest, "E_BAD_REQUEST", "Body must be a JSON message"));
  }
  auto& context = sqlscope::app::app_context::instance();
  context.post([request = *body, cb = std::move(cb)]() {
    auto reply = sqlscope::app::app_context::instance().dispatcher().handle(request);
    auto resp = drogon::HttpResponse::newHttpJsonResponse(reply);
    resp->setStatusCode(HttpStatusCode::k200OK);
    cb(resp);
  });
}

void database_controller::get_tables(const HttpRequestPtr&, callback&& cb) {
  Json::Value request(Json::objectValue);
  request["command"] = "getTables";
  respond(std::move(request), "tables", std::move(cb));
}

void database_controller::get_info(const HttpRequestPtr&, callback&& cb) {
  Json::Value request(Json::objectValue);
  request["command"] = "getDatabaseInfo";
  respond(std::move(request), "info", std::move(cb));
}

void database_controller::get_columns(const HttpRequestPtr&, callback&& cb, std::string table) {
  respond(table_request("getTableInfo", table), "columns", std::move(cb));
}

void database_controller::get_indexes(const HttpRequestPtr&, callback&& cb, std::string table) {
  respond(table_request("getIndexes", table), "indexes", std::move(cb));
}

void database_controller::get_foreign_keys(const HttpRequestPtr&, callback&& cb, std::string table) {
  respond(table_request("getConstraints", table), "constraints", std::move(cb));
}

void database_controller::get_ddl(const HttpRequestPtr&, callback&& cb, std::string table) {
  respond(table_request("getTableStructure", table), "structure", std::move(cb));
}

void database_controller::get_data(const HttpRequestPtr& req, callback&& cb, std::string table) {
  auto request = table_request("getTableData", table);
  auto limit = req->getParameter("limit");
  auto offset = req->getParameter("offset");
  if (!limit.empty()) request["limit"] = limit;
  if (!offset.empty()) request["offset"] = offset;
  respond(std::move(request), "result", std::move(cb));
}

void database_controller::post_query(const HttpRequestPtr& req, callback&& cb) {
  Json::Value request;
  if (!query_request(req, "executeQuery", request)) {
    return cb(sqlscope::http::error(HttpStatusCode::k400BadRequest, "E_BAD_REQUEST", "Body must be {\"query\": \"...\"}"));
  }
  respond(std::move(request), "result", std::move(cb));
}

void database_controller::post_format(const HttpRequestPtr& req, callback&& cb) {
  Json::Value request;
  if (!query_request(req, "formatQuery", request)) {
    return cb(sqlscope::http::error(HttpStatusCode::k400BadRequest, "E_BAD_REQUEST", "Body must be {\"query\": \"...\"}"));
  }
  respond(std::move(request), "formattedQuery", std::move(cb));
}

void database_controller::post_refresh(const HttpRequestPtr&, callback&& cb) {
  auto& context = sqlscope::app::app_context::instance();
  context.post([cb = std::move(cb)]() {
    Json::Value data(Json::objectValue);
    data["subscribers"] = static_cast<Json::UInt64>(events_controller::broadcast_refresh());
    cb(sqlscope::http::ok(data));
  });
}

}
