#pragma once
#include <drogon/HttpController.h>

namespace sqlscope::controllers {

class database_controller : public drogon::HttpController<database_controller> {
 public:
  METHOD_LIST_BEGIN
  // Message protocol over plain HTTP
  ADD_METHOD_TO(database_controller::post_message, "/api/message", drogon::Post, "sqlscope::filters::token_filter");
  // Resource style views of the same operations
  ADD_METHOD_TO(database_controller::get_tables, "/api/tables", drogon::Get, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::get_info, "/api/info", drogon::Get, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::get_columns, "/api/tables/{1}/columns", drogon::Get, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::get_indexes, "/api/tables/{1}/indexes", drogon::Get, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::get_foreign_keys, "/api/tables/{1}/foreign-keys", drogon::Get, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::get_ddl, "/api/tables/{1}/ddl", drogon::Get, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::get_data, "/api/tables/{1}/data", drogon::Get, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::post_query, "/api/query", drogon::Post, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::post_format, "/api/format", drogon::Post, "sqlscope::filters::token_filter");
  ADD_METHOD_TO(database_controller::post_refresh, "/api/refresh", drogon::Post, "sqlscope::filters::token_filter");
  METHOD_LIST_END

  using callback = std::function<void(const drogon::HttpResponsePtr&)>;

  void post_message(const drogon::HttpRequestPtr& req, callback&& cb);
  void get_tables(const drogon::HttpRequestPtr& req, callback&& cb);
  void get_info(const drogon::HttpRequestPtr& req, callback&& cb);
  void get_columns(const drogon::HttpRequestPtr& req, callback&& cb, std::string table);
  void get_indexes(const drogon::HttpRequestPtr& req, callback&& cb, std::string table);
  void get_foreign_keys(const drogon::HttpRequestPtr& req, callback&& cb, std::string table);
  void get_ddl(const drogon::HttpRequestPtr& req, callback&& cb, std::string table);
  void get_data(const drogon::HttpRequestPtr& req, callback&& cb, std::string table);
  void post_query(const drogon::HttpRequestPtr& req, callback&& cb);
  void post_format(const drogon::HttpRequestPtr& req, callback&& cb);
  void post_refresh(const drogon::HttpRequestPtr& req, callback&& cb);
};

}
