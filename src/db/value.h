#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

struct sqlite3_stmt;

namespace sqlscope::db {

using Blob = std::vector<unsigned char>;

// One cell as stored by SQLite. Alternatives line up with the storage classes:
// NULL, INTEGER, REAL, TEXT, BLOB.
using Value = std::variant<std::monostate, int64_t, double, std::string, Blob>;

enum class ValueType { Null, Integer, Real, Text, Blob };

ValueType value_type(const Value& v);
const char* value_type_name(ValueType t);
inline bool is_null(const Value& v) { return std::holds_alternative<std::monostate>(v); }

// Reads column `col` of the current row without converting between storage classes.
Value read_column(sqlite3_stmt* stmt, int col);

// Text rendering for terminals: NULL -> "NULL", blobs -> X'..' hex literal.
std::string to_display(const Value& v);

}
