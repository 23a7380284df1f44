#pragma once

#include <mutex>
#include <string>

namespace sqlscope::options {

class runtime_options {
public:
  static runtime_options& instance();

  void set_runtime(const std::string& db_path_value, int row_limit_value, int poll_interval_ms_value);

  std::string db_path() const;
  int row_limit() const;
  int poll_interval_ms() const;

  void set_listener(const std::string& address_value, int port_value);
  std::string listen_address() const;
  int listen_port() const;

  void set_token(const std::string& token_value);
  std::string token() const;
  bool token_required() const;

private:
  runtime_options() = default;
  runtime_options(const runtime_options&) = delete;
  runtime_options& operator=(const runtime_options&) = delete;

  std::string db_path_storage;
  int row_limit_storage = 1000;
  int poll_interval_ms_storage = 1000;
  std::string listen_address_storage = "127.0.0.1";
  int listen_port_storage = 0;
  std::string token_storage;
  mutable std::mutex state_mutex;
};

}
