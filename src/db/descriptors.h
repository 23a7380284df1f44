#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "value.h"

namespace sqlscope::db {

enum class TableKind { Table, View };

struct TableDescriptor {
  std::string name;
  TableKind kind{TableKind::Table};
  std::optional<int64_t> row_count;  // tables only; unset when counting failed
};

struct ColumnDescriptor {
  int ordinal{};
  std::string name;
  std::string declared_type;
  bool not_null{};
  std::optional<Value> default_value;  // the default expression as text, if any
  bool is_primary_key{};
  int primary_key_index{};  // 1-based position inside the key, 0 if not a key column
};

struct IndexColumn {
  int ordinal{};     // position inside the index
  int table_column{};  // cid in the table, -1 for rowid, -2 for expressions
  std::string name;  // empty for expression columns
};

struct IndexDescriptor {
  std::string name;
  bool is_unique{};
  std::string origin;  // "c" CREATE INDEX, "u" UNIQUE constraint, "pk" PRIMARY KEY
  bool partial{};
  std::vector<IndexColumn> columns;
};

struct ForeignKeyDescriptor {
  int id{};
  int seq{};
  std::string from_column;
  std::string to_table;
  std::string to_column;  // empty when the parent key is implicit
  std::string on_update;
  std::string on_delete;
  std::string match;
};

struct DatabaseInfo {
  // Engine settings in read order; nullopt marks a setting that could not be read.
  std::vector<std::pair<std::string, std::optional<Value>>> settings;
  std::optional<uint64_t> file_size_bytes;
  std::string file_size;  // "Unknown" when the file could not be stat'ed
  std::string filename;
};

enum class ResultKind { Rows, Mutation };

struct QueryResult {
  ResultKind kind{ResultKind::Mutation};
  std::vector<std::string> columns;
  std::vector<std::vector<Value>> rows;
  int64_t affected_count{};
  std::optional<std::string> error;

  bool ok() const { return !error.has_value(); }
  bool has_rows() const { return kind == ResultKind::Rows; }

  static QueryResult failure(std::string message) {
    QueryResult r;
    r.error = std::move(message);
    return r;
  }
};

}
