#include "json_response.h"

namespace sqlscope::http {

using drogon::HttpResponse;
using drogon::HttpResponsePtr;
using drogon::HttpStatusCode;

HttpResponsePtr ok(Json::Value data) {
  Json::Value root(Json::objectValue);
  root["success"] = true;
  root["message"] = "OK";
  root["data"] = std::move(data);
  auto resp = HttpResponse::newHttpJsonResponse(root);
  resp->setStatusCode(HttpStatusCode::k200OK);
  return resp;
}

HttpResponsePtr error(HttpStatusCode status, const std::string& code, const std::string& message) {
  Json::Value root(Json::objectValue);
  root["success"] = false;
  root["code"] = code;
  root["message"] = message;
  auto resp = HttpResponse::newHttpJsonResponse(root);
  resp->setStatusCode(status);
  return resp;
}

HttpStatusCode status_for_code(const std::string& code) {
  if (code == "E_BAD_REQUEST") return HttpStatusCode::k400BadRequest;
  if (code == "E_UNAUTHORIZED") return HttpStatusCode::k401Unauthorized;
  if (code == "E_NOT_FOUND") return HttpStatusCode::k404NotFound;
  if (code == "E_FORMAT") return HttpStatusCode::k422UnprocessableEntity;
  if (code == "E_CONNECTION") return HttpStatusCode::k503ServiceUnavailable;
  return HttpStatusCode::k500InternalServerError;
}

HttpResponsePtr from_error_message(const Json::Value& reply) {
  const std::string code = reply.get("code", "E_INTERNAL").asString();
  return error(status_for_code(code), code, reply.get("message", "").asString());
}

}
