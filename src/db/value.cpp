#include "value.h"
#include <sqlite3.h>
#include <sstream>

namespace sqlscope::db {

ValueType value_type(const Value& v) {
  switch (v.index()) {
    case 1: return ValueType::Integer;
    case 2: return ValueType::Real;
    case 3: return ValueType::Text;
    case 4: return ValueType::Blob;
    default: return ValueType::Null;
  }
}

const char* value_type_name(ValueType t) {
  switch (t) {
    case ValueType::Integer: return "integer";
    case ValueType::Real: return "real";
    case ValueType::Text: return "text";
    case ValueType::Blob: return "blob";
    case ValueType::Null: break;
  }
  return "null";
}

Value read_column(sqlite3_stmt* stmt, int col) {
  switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER:
      return Value{static_cast<int64_t>(sqlite3_column_int64(stmt, col))};
    case SQLITE_FLOAT:
      return Value{sqlite3_column_double(stmt, col)};
    case SQLITE_TEXT: {
      const unsigned char* t = sqlite3_column_text(stmt, col);
      int n = sqlite3_column_bytes(stmt, col);
      return Value{std::string(t ? reinterpret_cast<const char*>(t) : "", static_cast<size_t>(n))};
    }
    case SQLITE_BLOB: {
      const auto* p = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, col));
      int n = sqlite3_column_bytes(stmt, col);
      return Value{p ? Blob(p, p + n) : Blob()};
    }
    default:
      return Value{};
  }
}

std::string to_display(const Value& v) {
  switch (value_type(v)) {
    case ValueType::Null: return "NULL";
    case ValueType::Integer: return std::to_string(std::get<int64_t>(v));
    case ValueType::Real: {
      std::ostringstream oss;
      oss.precision(15);
      oss << std::get<double>(v);
      return oss.str();
    }
    case ValueType::Text: return std::get<std::string>(v);
    case ValueType::Blob: {
      static const char* hex = "0123456789ABCDEF";
      const auto& b = std::get<Blob>(v);
      std::string out = "X'";
      out.reserve(b.size() * 2 + 3);
      for (unsigned char c : b) {
        out.push_back(hex[(c >> 4) & 0xF]);
        out.push_back(hex[c & 0xF]);
      }
      out.push_back('\'');
      return out;
    }
  }
  return {};
}

}
