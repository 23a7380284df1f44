#include "options.h"

namespace sqlscope::options {

runtime_options& runtime_options::instance() {
  static runtime_options runtime_state;
  return runtime_state;
}

void runtime_options::set_runtime(const std::string& db_path_value, int row_limit_value, int poll_interval_ms_value) {
  std::lock_guard<std::mutex> guard(state_mutex);
  db_path_storage = db_path_value;
  row_limit_storage = row_limit_value;
  poll_interval_ms_storage = poll_interval_ms_value;
}

std::string runtime_options::db_path() const {
  std::lock_guard<std::mutex> guard(state_mutex);
  return db_path_storage;
}

int runtime_options::row_limit() const {
  std::lock_guard<std::mutex> guard(state_mutex);
  return row_limit_storage;
}

int runtime_options::poll_interval_ms() const {
  std::lock_guard<std::mutex> guard(state_mutex);
  return poll_interval_ms_storage;
}

void runtime_options::set_listener(const std::string& address_value, int port_value) {
  std::lock_guard<std::mutex> guard(state_mutex);
  listen_address_storage = address_value;
  listen_port_storage = port_value;
}

std::string runtime_options::listen_address() const {
  std::lock_guard<std::mutex> guard(state_mutex);
  return listen_address_storage;
}

int runtime_options::listen_port() const {
  std::lock_guard<std::mutex> guard(state_mutex);
  return listen_port_storage;
}

void runtime_options::set_token(const std::string& token_value) {
  std::lock_guard<std::mutex> guard(state_mutex);
  token_storage = token_value;
}

std::string runtime_options::token() const {
  std::lock_guard<std::mutex> guard(state_mutex);
  return token_storage;
}

bool runtime_options::token_required() const {
  std::lock_guard<std::mutex> guard(state_mutex);
  return !token_storage.empty();
}

}
