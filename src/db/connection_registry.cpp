#include "connection_registry.h"
#include <filesystem>
#include <vector>
#include <drogon/drogon.h>
#include "errors.h"

namespace fs = std::filesystem;

namespace sqlscope::db {

ConnectionRegistry::~ConnectionRegistry() {
  close_all();
}

std::string ConnectionRegistry::normalize_path(const std::string& path) {
  std::error_code ec;
  fs::path p = fs::absolute(fs::path(path), ec);
  if (ec) p = fs::path(path);
  return p.lexically_normal().string();
}

Connection& ConnectionRegistry::open(const std::string& path) {
  const std::string key = normalize_path(path);
  // The lock is held across the engine open so a second opener of the same path waits
  // and then reuses the handle instead of creating its own.
  std::lock_guard<std::mutex> guard(registry_mutex_);
  auto it = connections_.find(key);
  if (it != connections_.end()) return *it->second;
  auto conn = Connection::open(key);
  Connection& ref = *conn;
  connections_.emplace(key, std::move(conn));
  return ref;
}

void ConnectionRegistry::close(const std::string& path) {
  const std::string key = normalize_path(path);
  std::unique_ptr<Connection> conn;
  {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    auto it = connections_.find(key);
    if (it == connections_.end()) return;
    conn = std::move(it->second);
    connections_.erase(it);
  }
  // Wait for an in-flight operation on this handle before closing it.
  auto op = conn->guard();
  conn->close();
}

void ConnectionRegistry::close_all() {
  std::vector<std::unique_ptr<Connection>> closing;
  {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    for (auto& entry : connections_) closing.push_back(std::move(entry.second));
    connections_.clear();
  }
  for (auto& conn : closing) {
    try {
      auto op = conn->guard();
      conn->close();
    } catch (const db_error& e) {
      LOG_ERROR << e.what();
    }
  }
}

bool ConnectionRegistry::is_open(const std::string& path) const {
  const std::string key = normalize_path(path);
  std::lock_guard<std::mutex> guard(registry_mutex_);
  return connections_.find(key) != connections_.end();
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> guard(registry_mutex_);
  return connections_.size();
}

}
