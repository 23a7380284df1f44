#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "connection.h"

namespace sqlscope::db {

// Owns at most one open Connection per database path. Callers get non-owning
// references that stay valid until close()/close_all() for that path.
class ConnectionRegistry {
 public:
  ConnectionRegistry() = default;
  ~ConnectionRegistry();
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  // Returns the live connection for `path`, opening it on first use.
  // Throws connection_error when the file cannot be opened.
  Connection& open(const std::string& path);

  // Closes and forgets the connection for `path`; no-op if none is open. The entry is
  // removed even when the engine close fails (connection_error is still thrown).
  void close(const std::string& path);

  // Closes everything. Failures are logged and do not stop the remaining closes.
  void close_all();

  bool is_open(const std::string& path) const;
  size_t size() const;

  // Absolute, lexically normalized form used as the registry key.
  static std::string normalize_path(const std::string& path);

 private:
  mutable std::mutex registry_mutex_;
  std::map<std::string, std::unique_ptr<Connection>> connections_;
};

}
