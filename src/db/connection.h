#pragma once
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace sqlscope::db {

// Finalizes the wrapped statement when it goes out of scope.
class Statement {
 public:
  Statement() = default;
  explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
  ~Statement();
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& other) noexcept : stmt_(other.stmt_) { other.stmt_ = nullptr; }
  Statement& operator=(Statement&& other) noexcept;

  sqlite3_stmt* get() const { return stmt_; }
  sqlite3_stmt** out() { return &stmt_; }
  operator sqlite3_stmt*() const { return stmt_; }
  explicit operator bool() const { return stmt_ != nullptr; }

 private:
  sqlite3_stmt* stmt_{nullptr};
};

// One live engine handle for one database file.
class Connection {
 public:
  // Opens `path` read-write (never creates it), turns on foreign key enforcement and
  // checks that the file really is a database. Throws connection_error.
  static std::unique_ptr<Connection> open(const std::string& path);

  ~Connection();
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  const std::string& path() const { return path_; }
  sqlite3* handle() const { return handle_; }
  bool is_open() const { return handle_ != nullptr; }

  // Held for the duration of every operation issued on this connection.
  std::unique_lock<std::mutex> guard() { return std::unique_lock<std::mutex>(op_mutex_); }

  // Returns the handle or throws connection_error when the connection was closed.
  sqlite3* require_open() const;

  // Closes the engine handle. The handle is released even when sqlite reports an
  // error, in which case connection_error is thrown.
  void close();

 private:
  Connection(std::string path, sqlite3* handle);

  std::string path_;
  sqlite3* handle_{nullptr};
  std::mutex op_mutex_;
};

}
