#pragma once
#include <stdexcept>
#include <string>

namespace sqlscope::db {

// Base of every failure raised by the database layer.
class db_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Opening or closing an engine handle failed (bad path, locked, not a database, ...).
class connection_error : public db_error {
 public:
  using db_error::db_error;
};

// An introspection call against a healthy connection was rejected by the engine.
class schema_error : public db_error {
 public:
  using db_error::db_error;
};

// A named table/view/object does not exist.
class not_found_error : public db_error {
 public:
  using db_error::db_error;
};

}
