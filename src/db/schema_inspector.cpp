#include "schema_inspector.h"
#include <sqlite3.h>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <drogon/drogon.h>
#include "errors.h"

namespace fs = std::filesystem;

namespace sqlscope::db::inspect {

namespace {

std::string column_text(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

// Prepares `sql` with `arg` bound to ?1, throwing schema_error on failure.
Statement prepare_with_name(sqlite3* db, const char* sql, const std::string& arg, const char* what) {
  Statement st;
  if (sqlite3_prepare_v2(db, sql, -1, st.out(), nullptr) != SQLITE_OK) {
    throw schema_error(std::string("Failed to get ") + what + ": " + sqlite3_errmsg(db));
  }
  sqlite3_bind_text(st, 1, arg.c_str(), -1, SQLITE_TRANSIENT);
  return st;
}

std::optional<int64_t> count_rows(sqlite3* db, const std::string& table) {
  std::string sql = "SELECT COUNT(*) FROM " + quote_identifier(table) + ";";
  Statement st;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, st.out(), nullptr) != SQLITE_OK) {
    LOG_WARN << "Failed to get row count for " << table << ": " << sqlite3_errmsg(db);
    return std::nullopt;
  }
  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    LOG_WARN << "Failed to get row count for " << table << ": " << sqlite3_errmsg(db);
    return std::nullopt;
  }
  return static_cast<int64_t>(sqlite3_column_int64(st, 0));
}

std::optional<std::vector<IndexColumn>> index_columns(sqlite3* db, const std::string& index) {
  Statement st;
  if (sqlite3_prepare_v2(db, "SELECT seqno, cid, name FROM pragma_index_info(?1) ORDER BY seqno;",
                         -1, st.out(), nullptr) != SQLITE_OK) {
    LOG_WARN << "Error getting index info for " << index << ": " << sqlite3_errmsg(db);
    return std::nullopt;
  }
  sqlite3_bind_text(st, 1, index.c_str(), -1, SQLITE_TRANSIENT);
  std::vector<IndexColumn> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    IndexColumn c;
    c.ordinal = sqlite3_column_int(st, 0);
    c.table_column = sqlite3_column_int(st, 1);
    c.name = column_text(st, 2);
    out.push_back(std::move(c));
  }
  if (rc != SQLITE_DONE) {
    LOG_WARN << "Error getting index info for " << index << ": " << sqlite3_errmsg(db);
    return std::nullopt;
  }
  return out;
}

std::optional<Value> read_pragma(sqlite3* db, const std::string& name) {
  if (!db) return std::nullopt;
  std::string sql = "PRAGMA " + name + ";";
  Statement st;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, st.out(), nullptr) != SQLITE_OK) return std::nullopt;
  if (sqlite3_step(st) != SQLITE_ROW) return std::nullopt;
  return read_column(st, 0);
}

}  // namespace

std::string quote_identifier(const std::string& name) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::vector<TableDescriptor> list_tables(Connection& conn) {
  auto lock = conn.guard();
  sqlite3* db = conn.require_open();
  const char* sql =
      "SELECT name, type FROM sqlite_master\n"
      "WHERE type IN ('table', 'view') AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\'\n"
      "ORDER BY CASE type WHEN 'table' THEN 1 WHEN 'view' THEN 2 ELSE 3 END, name;";
  std::vector<TableDescriptor> out;
  {
    Statement st;
    if (sqlite3_prepare_v2(db, sql, -1, st.out(), nullptr) != SQLITE_OK) {
      throw schema_error(std::string("Failed to get tables: ") + sqlite3_errmsg(db));
    }
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
      TableDescriptor t;
      t.name = column_text(st, 0);
      t.kind = column_text(st, 1) == "view" ? TableKind::View : TableKind::Table;
      out.push_back(std::move(t));
    }
    if (rc != SQLITE_DONE) throw schema_error(std::string("Failed to get tables: ") + sqlite3_errmsg(db));
  }
  for (auto& t : out) {
    if (t.kind == TableKind::Table) t.row_count = count_rows(db, t.name);
  }
  return out;
}

std::vector<ColumnDescriptor> columns(Connection& conn, const std::string& table) {
  auto lock = conn.guard();
  sqlite3* db = conn.require_open();
  auto st = prepare_with_name(
      db, "SELECT cid, name, type, \"notnull\", dflt_value, pk FROM pragma_table_info(?1) ORDER BY cid;",
      table, "table info");
  std::vector<ColumnDescriptor> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    ColumnDescriptor c;
    c.ordinal = sqlite3_column_int(st, 0);
    c.name = column_text(st, 1);
    c.declared_type = column_text(st, 2);
    c.not_null = sqlite3_column_int(st, 3) != 0;
    if (sqlite3_column_type(st, 4) != SQLITE_NULL) c.default_value = read_column(st, 4);
    c.primary_key_index = sqlite3_column_int(st, 5);
    c.is_primary_key = c.primary_key_index > 0;
    out.push_back(std::move(c));
  }
  if (rc != SQLITE_DONE) throw schema_error(std::string("Failed to get table info: ") + sqlite3_errmsg(db));
  return out;
}

std::vector<IndexDescriptor> indexes(Connection& conn, const std::string& table) {
  auto lock = conn.guard();
  sqlite3* db = conn.require_open();
  auto st = prepare_with_name(
      db, "SELECT name, \"unique\", origin, partial FROM pragma_index_list(?1) ORDER BY seq;",
      table, "indexes");
  std::vector<IndexDescriptor> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    IndexDescriptor ix;
    ix.name = column_text(st, 0);
    ix.is_unique = sqlite3_column_int(st, 1) != 0;
    ix.origin = column_text(st, 2);
    ix.partial = sqlite3_column_int(st, 3) != 0;
    out.push_back(std::move(ix));
  }
  if (rc != SQLITE_DONE) throw schema_error(std::string("Failed to get indexes: ") + sqlite3_errmsg(db));
  for (auto& ix : out) {
    if (auto cols = index_columns(db, ix.name)) ix.columns = std::move(*cols);
  }
  return out;
}

std::vector<ForeignKeyDescriptor> foreign_keys(Connection& conn, const std::string& table) {
  auto lock = conn.guard();
  sqlite3* db = conn.require_open();
  auto st = prepare_with_name(
      db,
      "SELECT id, seq, \"table\", \"from\", \"to\", on_update, on_delete, \"match\"\n"
      "FROM pragma_foreign_key_list(?1) ORDER BY id, seq;",
      table, "constraints");
  std::vector<ForeignKeyDescriptor> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    ForeignKeyDescriptor fk;
    fk.id = sqlite3_column_int(st, 0);
    fk.seq = sqlite3_column_int(st, 1);
    fk.to_table = column_text(st, 2);
    fk.from_column = column_text(st, 3);
    fk.to_column = column_text(st, 4);
    fk.on_update = column_text(st, 5);
    fk.on_delete = column_text(st, 6);
    fk.match = column_text(st, 7);
    out.push_back(std::move(fk));
  }
  if (rc != SQLITE_DONE) throw schema_error(std::string("Failed to get constraints: ") + sqlite3_errmsg(db));
  return out;
}

std::string ddl(Connection& conn, const std::string& name) {
  auto lock = conn.guard();
  sqlite3* db = conn.require_open();
  auto st = prepare_with_name(
      db, "SELECT sql FROM sqlite_master WHERE name = ?1 AND type IN ('table', 'view');",
      name, "table structure");
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    if (sqlite3_column_type(st, 0) == SQLITE_NULL) throw not_found_error("No structure found for " + name);
    return column_text(st, 0);
  }
  if (rc == SQLITE_DONE) throw not_found_error("No structure found for " + name);
  throw schema_error(std::string("Failed to get table structure: ") + sqlite3_errmsg(db));
}

const std::vector<std::string>& info_pragmas() {
  static const std::vector<std::string> names = {
      "user_version", "application_id", "auto_vacuum",
      "automatic_index", "busy_timeout", "cache_size",
      "journal_mode", "locking_mode", "page_size",
      "max_page_count", "secure_delete", "synchronous"};
  return names;
}

DatabaseInfo database_info(Connection& conn, const std::string& file_path) {
  DatabaseInfo info;
  {
    auto lock = conn.guard();
    sqlite3* db = conn.handle();
    for (const auto& name : info_pragmas()) {
      auto v = read_pragma(db, name);
      if (!v) LOG_WARN << "PRAGMA " << name << " unavailable for '" << conn.path() << "'";
      info.settings.emplace_back(name, std::move(v));
    }
  }
  std::error_code ec;
  auto size = fs::file_size(fs::path(file_path), ec);
  if (ec) {
    info.file_size = "Unknown";
  } else {
    info.file_size_bytes = static_cast<uint64_t>(size);
    info.file_size = format_file_size(static_cast<uint64_t>(size));
  }
  info.filename = fs::path(file_path).filename().string();
  return info;
}

std::string format_file_size(uint64_t bytes) {
  const double kb = 1024.0;
  char buf[64];
  if (bytes < 1024) {
    std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
  } else if (bytes < 1024ULL * 1024ULL) {
    std::snprintf(buf, sizeof(buf), "%.2f KB", static_cast<double>(bytes) / kb);
  } else if (bytes < 1024ULL * 1024ULL * 1024ULL) {
    std::snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(bytes) / (kb * kb));
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f GB", static_cast<double>(bytes) / (kb * kb * kb));
  }
  return buf;
}

}
