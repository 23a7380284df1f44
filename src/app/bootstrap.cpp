#include "app/bootstrap.h"

#include "app/cli_dispatcher.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <drogon/drogon.h>

#include "version.h"
#include "app/app_context.h"
#include "controllers/events_controller.h"
#include "db/errors.h"
#include "server/change_monitor.h"
#include "utils/embedded_config.h"
#include "utils/limits.h"
#include "utils/options.h"
#include "utils/strings.h"

#if SQLSCOPE_DEFAULT_ROW_LIMIT > SQLSCOPE_MAX_ROW_LIMIT
#error "SQLSCOPE_DEFAULT_ROW_LIMIT must be <= SQLSCOPE_MAX_ROW_LIMIT"
#endif

namespace sqlscope::app {

namespace {

namespace fs = std::filesystem;

std::optional<int> to_int(const char* s) {
  if (!s || !*s) return std::nullopt;
  try {
    return std::stoi(s);
  } catch (const std::exception&) {
    LOG_WARN << "Ignoring non-numeric value '" << s << "'";
    return std::nullopt;
  }
}

int clamp_limit(int value) {
  if (value <= 0) return SQLSCOPE_DEFAULT_ROW_LIMIT;
  return std::min(value, SQLSCOPE_MAX_ROW_LIMIT);
}

fs::path find_config_file() {
  fs::path cfg_home;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) cfg_home = fs::path(xdg);
  else if (const char* home = std::getenv("HOME"); home && *home) cfg_home = fs::path(home) / ".config";
  std::error_code ec;
  if (!cfg_home.empty()) {
    fs::path xdg_cfg = cfg_home / "sqlscope" / "sqlscope.json";
    if (fs::exists(xdg_cfg, ec)) return fs::absolute(xdg_cfg);
  }
  fs::path etc_cfg = fs::path("/etc") / "sqlscope" / "sqlscope.json";
  if (fs::exists(etc_cfg, ec)) return etc_cfg;
  fs::path local_cfg = fs::absolute("config/sqlscope.json");
  if (fs::exists(local_cfg, ec)) return local_cfg;
  return {};
}

bool parse_json(const std::string& text, Json::Value& root, std::string& errs) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), &root, &errs);
}

// Relative or missing log paths go to the XDG state dir; an unusable dir means stdout.
void resolve_log_path(Json::Value& root) {
  if (const char* env_log = std::getenv("SQLSCOPE_LOG_PATH"); env_log && *env_log) {
    root["log"]["log_path"] = env_log;
  }
  std::string configured;
  if (root.isMember("log") && root["log"]["log_path"].isString()) configured = root["log"]["log_path"].asString();
  fs::path target(configured);
  if (configured.empty() || target.is_relative()) {
    fs::path state_home;
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) state_home = fs::path(xdg);
    else if (const char* home = std::getenv("HOME"); home && *home) state_home = fs::path(home) / ".local" / "state";
    target = state_home.empty() ? fs::path() : state_home / "sqlscope" / "logs";
  }
  if (target.empty()) {
    root["log"].removeMember("log_path");
    return;
  }
  std::error_code ec;
  fs::create_directories(target, ec);
  if (ec) {
    std::cerr << "sqlscope: cannot create log directory '" << target.string() << "': " << ec.message()
              << "; logging to stdout\n";
    root["log"].removeMember("log_path");
    return;
  }
  root["log"]["log_path"] = target.string();
}

}  // namespace

bootstrap::bootstrap(int argc_value, char** argv_value)
    : argc_(argc_value), argv_(argv_value) {}

int bootstrap::execute() {
  auto& options_state = options::runtime_options::instance();

  std::string config_path;
  std::string address_override;
  std::string token_value;
  int port_override = -1;
  std::optional<int> limit_override;
  std::optional<int> poll_override;

  if (const char* env = std::getenv("SQLSCOPE_CONFIG"); env && *env) config_path = env;
  if (const char* env = std::getenv("SQLSCOPE_TOKEN"); env && *env) token_value = env;
  limit_override = to_int(std::getenv("SQLSCOPE_LIMIT_ROWS"));
  poll_override = to_int(std::getenv("SQLSCOPE_POLL_MS"));

  bool token_from_cli = false;
  for (int i = 1; i < argc_; ++i) {
    std::string arg = argv_[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc_) {
      config_path = argv_[++i];
    } else if (arg == "--address" && i + 1 < argc_) {
      address_override = argv_[++i];
    } else if (arg == "--port" && i + 1 < argc_) {
      port_override = to_int(argv_[++i]).value_or(-1);
    } else if (arg == "--limit" && i + 1 < argc_) {
      if (auto v = to_int(argv_[++i])) limit_override = v;
    } else if (arg == "--poll-ms" && i + 1 < argc_) {
      if (auto v = to_int(argv_[++i])) poll_override = v;
    } else if (arg == "--token" && i + 1 < argc_) {
      token_value = argv_[++i];
      token_from_cli = true;
    }
  }

  {
    cli_dispatcher dispatcher(argc_, argv_, clamp_limit(limit_override.value_or(SQLSCOPE_DEFAULT_ROW_LIMIT)));
    if (auto cli_exit = dispatcher.run(); cli_exit.has_value()) return *cli_exit;
    if (dispatcher.positionals().size() < 2) {
      std::cerr << "usage: sqlscope serve <database> [options]\n";
      return 2;
    }
    options_state.set_runtime(db::ConnectionRegistry::normalize_path(dispatcher.positionals()[1]),
                              SQLSCOPE_DEFAULT_ROW_LIMIT, SQLSCOPE_DEFAULT_POLL_MS);
  }

  fs::path config_absolute = config_path.empty() ? find_config_file() : fs::absolute(config_path);
  std::string json_content;
  if (config_absolute.empty()) {
    json_content = config::drogon_default_json();
  } else {
    std::ifstream ifs(config_absolute.string());
    if (!ifs) {
      std::cerr << "sqlscope: cannot read config file '" << config_absolute.string() << "'\n";
      return 1;
    }
    json_content.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  }

  Json::Value root;
  std::string errs;
  if (!parse_json(json_content, root, errs)) {
    std::cerr << "sqlscope: invalid config '" << config_absolute.string() << "': " << errs << "\n";
    return 1;
  }

  // Listener overrides replace the first listener, or add one when the file has none.
  std::string address = "127.0.0.1";
  int port = SQLSCOPE_DEFAULT_PORT;
  Json::Value& listeners = root["listeners"];
  if (listeners.isArray() && !listeners.empty()) {
    address = listeners[0].get("address", address).asString();
    port = listeners[0].get("port", port).asInt();
  }
  if (!address_override.empty()) address = address_override;
  if (port_override > 0) port = port_override;
  if (!listeners.isArray() || listeners.empty() || !address_override.empty() || port_override > 0) {
    Json::Value listener(Json::objectValue);
    listener["address"] = address;
    listener["port"] = port;
    listener["https"] = false;
    if (!listeners.isArray()) listeners = Json::Value(Json::arrayValue);
    if (listeners.empty()) listeners.append(listener);
    else listeners[0] = listener;
  }

  resolve_log_path(root);

  const Json::Value section = root["custom_config"]["sqlscope"];
  int limit_value = SQLSCOPE_DEFAULT_ROW_LIMIT;
  int poll_value = SQLSCOPE_DEFAULT_POLL_MS;
  if (section.isObject()) {
    if (section["limit_rows"].isInt()) limit_value = section["limit_rows"].asInt();
    if (section["poll_interval_ms"].isInt()) poll_value = section["poll_interval_ms"].asInt();
    if (!token_from_cli && token_value.empty() && section["token"].isString()) token_value = section["token"].asString();
  }
  if (limit_override) limit_value = *limit_override;
  if (poll_override) poll_value = *poll_override;
  limit_value = clamp_limit(limit_value);
  if (poll_value < 0) poll_value = 0;

  if (token_value == "auto") {
    auto generated = str::random_hex(24);
    if (!generated) {
      std::cerr << "sqlscope: could not generate a random token\n";
      return 1;
    }
    token_value = *generated;
    std::cout << "Access token: " << token_value << std::endl;
  }

  const std::string db_path = options_state.db_path();
  options_state.set_runtime(db_path, limit_value, poll_value);
  options_state.set_listener(address, port);
  options_state.set_token(token_value);

  drogon::app().loadConfigJson(root);

  auto& context = app_context::instance();
  try {
    context.registry().open(db_path);
  } catch (const db::connection_error& e) {
    LOG_ERROR << e.what();
    std::cerr << "sqlscope: " << e.what() << "\n";
    return 1;
  }

  if (poll_value > 0) {
    auto monitor = std::make_shared<server::change_monitor>(db_path);
    drogon::app().getLoop()->runEvery(poll_value / 1000.0, [monitor]() {
      if (!monitor->poll()) return;
      LOG_DEBUG << "Change detected in " << monitor->path();
      app_context::instance().post([]() { controllers::events_controller::broadcast_refresh(); });
    });
  }

  LOG_INFO << "sqlscope " << SQLSCOPE_VERSION << " serving " << db_path << " on " << address << ":" << port
           << " (limit " << limit_value << ", poll " << poll_value << " ms"
           << (token_value.empty() ? "" : ", token required") << ")";
  if (config_absolute.empty()) LOG_INFO << "Using embedded configuration";
  else LOG_INFO << "Loaded configuration from " << config_absolute.string();

  drogon::app().run();
  context.shutdown();
  return 0;
}

}  // namespace sqlscope::app
