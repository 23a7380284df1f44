#pragma once
#include <stdexcept>
#include <string>

namespace sqlscope::sqlfmt {

class format_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Pretty-prints SQL for display.
// Rules:
// - Keywords are upper-cased; identifiers, literals and comments are kept verbatim
// - Major clauses (FROM, WHERE, GROUP BY, ORDER BY, LIMIT, joins, UNION, ...) start a line
// - The column list of CREATE TABLE is written one definition per line
// - Statements are separated by ";\n"
// Only the "sqlite" dialect is known. Unterminated literals, quoted identifiers or block
// comments, and unknown dialects, throw format_error.
std::string format(const std::string& sql, const std::string& dialect = "sqlite");

}
