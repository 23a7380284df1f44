#pragma once
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <string>

namespace sqlscope::http {

// { success: true, message: "OK", data }
drogon::HttpResponsePtr ok(Json::Value data);

// { success: false, code, message }
drogon::HttpResponsePtr error(drogon::HttpStatusCode status,
                              const std::string& code,
                              const std::string& message);

// HTTP status for a protocol error code (E_NOT_FOUND -> 404, E_CONNECTION -> 503, ...).
// Unknown codes map to 500.
drogon::HttpStatusCode status_for_code(const std::string& code);

// Envelope for a { command: "error", code, message } protocol reply.
drogon::HttpResponsePtr from_error_message(const Json::Value& reply);

}
