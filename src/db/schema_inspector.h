#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "connection.h"
#include "descriptors.h"

namespace sqlscope::db::inspect {

// Tables then views, each group by name; sqlite_* internals are skipped. Row counts are
// attached to tables; a table that cannot be counted keeps row_count unset.
std::vector<TableDescriptor> list_tables(Connection& conn);

// Throws schema_error when the engine rejects the introspection call.
std::vector<ColumnDescriptor> columns(Connection& conn, const std::string& table);

// An index whose column list cannot be read is returned with no columns.
std::vector<IndexDescriptor> indexes(Connection& conn, const std::string& table);

std::vector<ForeignKeyDescriptor> foreign_keys(Connection& conn, const std::string& table);

// Stored CREATE statement of a table or view. Throws not_found_error.
std::string ddl(Connection& conn, const std::string& name);

// Engine settings plus file size and display name. Never fails: unreadable settings are
// left unset and an unreadable file reports "Unknown".
DatabaseInfo database_info(Connection& conn, const std::string& file_path);

// Settings reported by database_info, in order.
const std::vector<std::string>& info_pragmas();

// "512 B", "1.50 KB", "3.00 MB", "1.25 GB" (1024-based, two decimals).
std::string format_file_size(uint64_t bytes);

// Double-quoted SQL identifier with embedded quotes doubled.
std::string quote_identifier(const std::string& name);

}
