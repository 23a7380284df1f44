#include "embedded_config.h"
#include "limits.h"

namespace sqlscope::config {

static std::string build_with_listener(const std::string& address, int port) {
  return std::string(R"JSON({
  "app": {
    "name": "sqlscope",
    "threads": 0
  },
  "listeners": [
    {
      "address": ")JSON") + address + std::string(R"JSON(",
      "port": )JSON") + std::to_string(port) + std::string(R"JSON(,
      "https": false
    }
  ],
  "log": {
    "log_level": "INFO",
    "log_path": "./logs"
  },
  "client_max_body_size": 1048576,
  "custom_config": {
    "sqlscope": {
      "limit_rows": )JSON") + std::to_string(SQLSCOPE_DEFAULT_ROW_LIMIT) + std::string(R"JSON(,
      "poll_interval_ms": )JSON") + std::to_string(SQLSCOPE_DEFAULT_POLL_MS) + std::string(R"JSON(
    }
  },
  "db_clients": []
})JSON");
}

static const std::string kEmbedded = build_with_listener("127.0.0.1", SQLSCOPE_DEFAULT_PORT);

const std::string& drogon_default_json() { return kEmbedded; }
std::string drogon_build_config_json(const std::string& address, int port) { return build_with_listener(address, port); }

}
