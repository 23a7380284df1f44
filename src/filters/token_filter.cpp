#include "token_filter.h"
#include <drogon/drogon.h>
#include <optional>
#include <string>
#include "utils/json_response.h"
#include "utils/options.h"
#include "utils/strings.h"

using drogon::HttpRequestPtr;
using drogon::HttpStatusCode;

namespace sqlscope::filters {

// Bearer header first, then x-api-key, then ?token= (browsers cannot set headers on
// WebSocket upgrades).
static std::optional<std::string> get_token(const HttpRequestPtr& req) {
  auto auth = req->getHeader("authorization");
  static const std::string bearer = "Bearer ";
  if (auth.size() > bearer.size() && auth.compare(0, bearer.size(), bearer) == 0) {
    return sqlscope::str::trim(auth.substr(bearer.size()));
  }
  auto k = req->getHeader("x-api-key");
  if (!k.empty()) return k;
  auto p = req->getParameter("token");
  if (!p.empty()) return p;
  return std::nullopt;
}

void token_filter::doFilter(const HttpRequestPtr& req,
                            drogon::FilterCallback&& fcb,
                            drogon::FilterChainCallback&& fccb) {
  auto& options_state = sqlscope::options::runtime_options::instance();
  if (!options_state.token_required()) return fccb();

  auto presented = get_token(req);
  if (presented && sqlscope::str::constant_time_equals(*presented, options_state.token())) return fccb();

  LOG_WARN << "rejected request without valid token from " << req->getPeerAddr().toIp()
           << " for " << req->path();
  auto resp = sqlscope::http::error(HttpStatusCode::k401Unauthorized, "E_UNAUTHORIZED",
                                    presented ? "Invalid token" : "Missing token");
  resp->addHeader("WWW-Authenticate", "Bearer");
  fcb(resp);
}

}
