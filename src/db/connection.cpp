#include "connection.h"
#include <sqlite3.h>
#include <drogon/drogon.h>
#include "errors.h"

namespace sqlscope::db {

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    if (stmt_) sqlite3_finalize(stmt_);
    stmt_ = other.stmt_;
    other.stmt_ = nullptr;
  }
  return *this;
}

Connection::Connection(std::string path, sqlite3* handle)
    : path_(std::move(path)), handle_(handle) {}

Connection::~Connection() {
  if (handle_) {
    if (sqlite3_close_v2(handle_) != SQLITE_OK) {
      LOG_WARN << "sqlite close failed for '" << path_ << "': " << sqlite3_errmsg(handle_);
    }
    handle_ = nullptr;
  }
}

std::unique_ptr<Connection> Connection::open(const std::string& path) {
  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    if (db) sqlite3_close(db);
    throw connection_error("Failed to open database '" + path + "': " + msg);
  }
  sqlite3_extended_result_codes(db, 1);

  // The file header is only read lazily, so touch the catalog to reject non-database
  // files (and locked ones) here rather than on the first real query.
  char* errmsg = nullptr;
  rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON; SELECT count(*) FROM sqlite_master;",
                    nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    std::string msg = errmsg ? errmsg : sqlite3_errstr(rc);
    if (errmsg) sqlite3_free(errmsg);
    sqlite3_close(db);
    throw connection_error("Failed to open database '" + path + "': " + msg);
  }
  LOG_INFO << "opened sqlite database '" << path << "'";
  return std::unique_ptr<Connection>(new Connection(path, db));
}

sqlite3* Connection::require_open() const {
  if (!handle_) throw connection_error("Database connection to '" + path_ + "' is closed");
  return handle_;
}

void Connection::close() {
  if (!handle_) return;
  sqlite3* db = handle_;
  handle_ = nullptr;
  // close_v2 defers the real close until outstanding statements are finalized, so the
  // handle is gone from our side either way.
  if (sqlite3_close_v2(db) != SQLITE_OK) {
    throw connection_error("Failed to close database '" + path_ + "': " + sqlite3_errmsg(db));
  }
  LOG_DEBUG << "closed sqlite database '" << path_ << "'";
}

}
