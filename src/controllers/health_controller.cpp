#include "health_controller.h"
#include <drogon/drogon.h>
#include "app/app_context.h"
#include "utils/options.h"
#include "utils/limits.h"
#include "version.h"

namespace sqlscope::controllers {

void health_controller::health(const drogon::HttpRequestPtr& req, std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
  auto& options_state = sqlscope::options::runtime_options::instance();
  auto& registry = sqlscope::app::app_context::instance().registry();
  Json::Value out;
  out["status"] = "ok";
  out["version"] = SQLSCOPE_VERSION;
  out["db_path"] = options_state.db_path();
  out["db_open"] = registry.is_open(options_state.db_path());
  out["open_connections"] = static_cast<Json::UInt64>(registry.size());
  out["limit_rows"] = options_state.row_limit();
  out["limit_max"] = SQLSCOPE_MAX_ROW_LIMIT;
  out["poll_interval_ms"] = options_state.poll_interval_ms();
  out["token_required"] = options_state.token_required();
  auto resp = drogon::HttpResponse::newHttpJsonResponse(out);
  resp->setStatusCode(drogon::k200OK);
  cb(resp);
}

}
