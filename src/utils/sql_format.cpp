#include "sql_format.h"
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <vector>

namespace sqlscope::sqlfmt {

namespace {

enum class Tok { Word, Number, String, Quoted, LineComment, BlockComment, Punct };

struct Token {
  Tok kind;
  std::string text;
  std::string upper;  // upper-cased text for words
};

const std::unordered_set<std::string>& keywords() {
  static const std::unordered_set<std::string> k = {
      "ABORT", "ACTION", "ADD", "AFTER", "ALL", "ALTER", "ALWAYS", "ANALYZE", "AND", "AS", "ASC",
      "ATTACH", "AUTOINCREMENT", "BEFORE", "BEGIN", "BETWEEN", "BY", "CASCADE", "CASE", "CAST",
      "CHECK", "COLLATE", "COLUMN", "COMMIT", "CONFLICT", "CONSTRAINT", "CREATE", "CROSS",
      "CURRENT_DATE", "CURRENT_TIME", "CURRENT_TIMESTAMP", "DEFAULT", "DEFERRABLE", "DEFERRED",
      "DELETE", "DESC", "DETACH", "DISTINCT", "DO", "DROP", "EACH", "ELSE", "END", "ESCAPE",
      "EXCEPT", "EXCLUSIVE", "EXISTS", "EXPLAIN", "FAIL", "FILTER", "FOR", "FOREIGN", "FROM",
      "FULL", "GENERATED", "GLOB", "GROUP", "HAVING", "IF", "IGNORE", "IMMEDIATE", "IN", "INDEX",
      "INDEXED", "INITIALLY", "INNER", "INSERT", "INSTEAD", "INTERSECT", "INTO", "IS", "ISNULL",
      "JOIN", "KEY", "LEFT", "LIKE", "LIMIT", "MATCH", "NATURAL", "NO", "NOT", "NOTHING",
      "NOTNULL", "NULL", "NULLS", "OF", "OFFSET", "ON", "OR", "ORDER", "OUTER", "OVER",
      "PARTITION", "PLAN", "PRAGMA", "PRIMARY", "QUERY", "RAISE", "RECURSIVE", "REFERENCES",
      "REGEXP", "REINDEX", "RELEASE", "RENAME", "REPLACE", "RESTRICT", "RETURNING", "RIGHT",
      "ROLLBACK", "ROW", "ROWID", "SAVEPOINT", "SELECT", "SET", "STORED", "STRICT", "TABLE",
      "TEMP", "TEMPORARY", "THEN", "TO", "TRANSACTION", "TRIGGER", "UNION", "UNIQUE", "UPDATE",
      "USING", "VACUUM", "VALUES", "VIEW", "VIRTUAL", "WHEN", "WHERE", "WINDOW", "WITH",
      "WITHOUT",
      // column type names
      "INTEGER", "INT", "TEXT", "REAL", "BLOB", "NUMERIC", "BOOLEAN", "VARCHAR", "CHAR",
      "CHARACTER", "DECIMAL", "DOUBLE", "FLOAT", "BIGINT", "SMALLINT", "TINYINT", "NVARCHAR",
      "CLOB", "DATETIME", "TIMESTAMP"};
  return k;
}

// Type names read like function calls: VARCHAR(20), NUMERIC(10, 2).
const std::unordered_set<std::string>& type_keywords() {
  static const std::unordered_set<std::string> k = {
      "INTEGER", "INT", "TEXT", "REAL", "BLOB", "NUMERIC", "BOOLEAN", "VARCHAR", "CHAR",
      "CHARACTER", "DECIMAL", "DOUBLE", "FLOAT", "BIGINT", "SMALLINT", "TINYINT", "NVARCHAR",
      "CLOB", "DATETIME", "TIMESTAMP", "CAST", "REPLACE", "RAISE"};
  return k;
}

const std::unordered_set<std::string>& join_modifiers() {
  static const std::unordered_set<std::string> k = {"LEFT", "RIGHT", "INNER", "OUTER", "CROSS", "NATURAL", "FULL"};
  return k;
}

bool is_keyword(const Token& t) {
  return t.kind == Tok::Word && keywords().count(t.upper) > 0;
}

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
         (static_cast<unsigned char>(c) & 0x80u);
}

std::vector<Token> tokenize(const std::string& sql) {
  std::vector<Token> out;
  const size_t n = sql.size();
  size_t i = 0;
  auto closing = [&](size_t start, char close, bool doubled_escape, const char* what) {
    size_t j = start + 1;
    while (true) {
      if (j >= n) throw format_error(std::string("unterminated ") + what);
      if (sql[j] == close) {
        if (doubled_escape && j + 1 < n && sql[j + 1] == close) { j += 2; continue; }
        return j + 1;
      }
      ++j;
    }
  };
  while (i < n) {
    char c = sql[i];
    if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }
    if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
      size_t j = sql.find('\n', i);
      if (j == std::string::npos) j = n;
      out.push_back({Tok::LineComment, sql.substr(i, j - i), {}});
      i = j;
      continue;
    }
    if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
      size_t j = sql.find("*/", i + 2);
      if (j == std::string::npos) throw format_error("unterminated block comment");
      out.push_back({Tok::BlockComment, sql.substr(i, j + 2 - i), {}});
      i = j + 2;
      continue;
    }
    if (c == '\'') {
      size_t j = closing(i, '\'', true, "string literal");
      out.push_back({Tok::String, sql.substr(i, j - i), {}});
      i = j;
      continue;
    }
    if (c == '"' || c == '`' || c == '[') {
      char close = c == '[' ? ']' : c;
      size_t j = closing(i, close, c != '[', "quoted identifier");
      out.push_back({Tok::Quoted, sql.substr(i, j - i), {}});
      i = j;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && i + 1 < n && std::isdigit(static_cast<unsigned char>(sql[i + 1])))) {
      size_t j = i;
      while (j < n && (std::isalnum(static_cast<unsigned char>(sql[j])) || sql[j] == '.' ||
                       ((sql[j] == '+' || sql[j] == '-') && (sql[j - 1] == 'e' || sql[j - 1] == 'E')))) {
        ++j;
      }
      out.push_back({Tok::Number, sql.substr(i, j - i), {}});
      i = j;
      continue;
    }
    if (is_word_char(c) || c == '?' || c == ':' || c == '@') {
      size_t j = i + 1;
      while (j < n && is_word_char(sql[j])) ++j;
      Token t{Tok::Word, sql.substr(i, j - i), {}};
      t.upper = t.text;
      std::transform(t.upper.begin(), t.upper.end(), t.upper.begin(),
                     [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
      out.push_back(std::move(t));
      i = j;
      continue;
    }
    static const char* two_char_ops[] = {"<=", ">=", "<>", "!=", "==", "||", "<<", ">>", "->"};
    std::string op(1, c);
    if (i + 1 < n) {
      std::string pair = sql.substr(i, 2);
      for (const char* o : two_char_ops) {
        if (pair == o) { op = pair; break; }
      }
    }
    out.push_back({Tok::Punct, op, {}});
    i += op.size();
  }
  return out;
}

class writer {
 public:
  std::string take() {
    while (!out_.empty() && (out_.back() == ' ' || out_.back() == '\n')) out_.pop_back();
    return std::move(out_);
  }

  void newline(int depth) {
    while (!out_.empty() && out_.back() == ' ') out_.pop_back();
    if (out_.empty()) return;
    if (out_.back() != '\n') out_.push_back('\n');
    out_.append(static_cast<size_t>(std::max(depth, 0)) * 2, ' ');
    at_line_start_ = true;
  }

  void put(const std::string& text, bool space_before) {
    if (space_before && !at_line_start_ && !out_.empty() && out_.back() != ' ') out_.push_back(' ');
    out_ += text;
    at_line_start_ = false;
  }

 private:
  std::string out_;
  bool at_line_start_{true};
};

}  // namespace

std::string format(const std::string& sql, const std::string& dialect) {
  if (dialect != "sqlite") throw format_error("unsupported dialect: " + dialect);
  const auto tokens = tokenize(sql);

  writer w;
  int depth = 0;
  bool first = true;           // next token starts a statement
  bool create_table = false;   // current statement is CREATE [TEMP] TABLE
  bool update_stmt = false;
  int column_list_depth = -1;  // depth of the CREATE TABLE column list, -1 if none open
  bool glue_next = false;      // previous token was "(", "." or a unary sign
  const Token* prev = nullptr;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token& t = tokens[i];
    if (first) {
      create_table = false;
      update_stmt = t.kind == Tok::Word && t.upper == "UPDATE";
      if (t.kind == Tok::Word && t.upper == "CREATE") {
        for (size_t k = i + 1; k < tokens.size() && k < i + 4; ++k) {
          if (tokens[k].kind != Tok::Word) break;
          if (tokens[k].upper == "TABLE") { create_table = true; break; }
          if (tokens[k].upper != "TEMP" && tokens[k].upper != "TEMPORARY") break;
        }
      }
    }
    const bool space = !glue_next;
    glue_next = false;

    if (t.kind == Tok::LineComment) {
      w.put(t.text, true);
      w.newline(depth);
      prev = nullptr;
      continue;
    }
    if (t.kind == Tok::BlockComment) {
      w.put(t.text, space);
      continue;
    }

    if (t.kind == Tok::Punct) {
      const std::string& p = t.text;
      if (p == ";") {
        w.put(";", false);
        w.newline(0);
        depth = 0;
        column_list_depth = -1;
        first = true;
        prev = nullptr;
        continue;
      }
      if (p == "(") {
        if (create_table && column_list_depth < 0 && depth == 0) {
          w.put("(", true);
          ++depth;
          column_list_depth = depth;
          w.newline(depth);
        } else {
          // calls and type sizes hug the name: count(*), VARCHAR(20), t(id)
          bool hug = prev && (prev->kind == Tok::Quoted ||
                              (prev->kind == Tok::Word &&
                               (!is_keyword(*prev) || type_keywords().count(prev->upper) > 0)));
          w.put("(", space && !hug);
          ++depth;
        }
        glue_next = true;
      } else if (p == ")") {
        if (depth == column_list_depth) {
          --depth;
          column_list_depth = -1;
          w.newline(depth);
        } else if (depth > 0) {
          --depth;
        }
        w.put(")", false);
      } else if (p == ",") {
        w.put(",", false);
        if (depth == column_list_depth) w.newline(depth);
      } else if (p == ".") {
        w.put(".", false);
        glue_next = true;
      } else {
        w.put(p, space);
        if (p == "-" || p == "+") {
          bool unary = !prev || is_keyword(*prev) ||
                       (prev->kind == Tok::Punct && prev->text != ")");
          glue_next = unary;
        }
      }
      first = false;
      prev = &t;
      continue;
    }

    if (t.kind == Tok::Word && is_keyword(t)) {
      const std::string& u = t.upper;
      bool after_open = prev && prev->kind == Tok::Punct && prev->text == "(";
      bool prev_join_mod = prev && prev->kind == Tok::Word && join_modifiers().count(prev->upper) > 0;
      bool breaks = false;
      if (!first && !after_open) {
        if (u == "FROM" || u == "WHERE" || u == "GROUP" || u == "ORDER" || u == "HAVING" ||
            u == "LIMIT" || u == "UNION" || u == "EXCEPT" || u == "INTERSECT" ||
            u == "VALUES" || u == "RETURNING" || u == "WINDOW") {
          breaks = true;
        } else if (u == "SELECT") {
          breaks = !(prev && prev->kind == Tok::Word && prev->upper == "AS");
        } else if (u == "SET") {
          breaks = update_stmt && depth == 0;
        } else if (u == "JOIN" || (join_modifiers().count(u) > 0 && u != "OUTER")) {
          breaks = !prev_join_mod;
        }
        // column definitions keep their constraints on one line
        if (column_list_depth > 0 && depth >= column_list_depth) breaks = false;
      }
      if (breaks) w.newline(depth);
      w.put(u, space || breaks);
    } else {
      w.put(t.text, space);
    }
    first = false;
    prev = &t;
  }
  return w.take();
}

}
