#include "app/cli_dispatcher.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include "db/connection_registry.h"
#include "db/errors.h"
#include "db/query_executor.h"
#include "db/schema_inspector.h"
#include "service/message_dispatcher.h"
#include "utils/limits.h"
#include "utils/sql_format.h"
#include "utils/strings.h"
#include "version.h"

namespace sqlscope::app {

namespace {

// Flags that consume the following argument.
const std::set<std::string>& value_flags() {
  static const std::set<std::string> flags = {
      "--limit", "--offset", "--port", "--address", "--token", "--config", "-c", "--poll-ms"};
  return flags;
}

constexpr size_t kMaxCellBytes = 1024;

std::string cell(const db::Value& v) {
  std::string text = db::to_display(v);
  for (auto& ch : text) {
    if (ch == '\t' || ch == '\n' || ch == '\r') ch = ' ';
  }
  if (text.size() > kMaxCellBytes) text = str::utf8_prefix(text, kMaxCellBytes) + "...";
  return text;
}

void print_result(const db::QueryResult& result) {
  if (!result.has_rows()) {
    std::cout << result.affected_count << " rows affected\n";
    return;
  }
  for (size_t i = 0; i < result.columns.size(); ++i) {
    std::cout << (i ? "\t" : "") << result.columns[i];
  }
  std::cout << '\n';
  for (const auto& row : result.rows) {
    for (size_t i = 0; i < row.size(); ++i) std::cout << (i ? "\t" : "") << cell(row[i]);
    std::cout << '\n';
  }
  std::cerr << "(" << result.rows.size() << " rows)\n";
}

std::optional<int> parse_int(const std::optional<std::string>& s) {
  if (!s) return std::nullopt;
  try {
    return std::stoi(*s);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace

cli_dispatcher::cli_dispatcher(int argc_value, char** argv_value, int row_limit_value)
    : argc_state(argc_value), argv_state(argv_value), row_limit(row_limit_value) {
  for (int i = 1; i < argc_state; ++i) {
    std::string arg = argv_state[i];
    if (value_flags().count(arg)) {
      ++i;
      continue;
    }
    if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') continue;
    if (arg == "-h" || arg == "-v") continue;
    positional_args.push_back(arg);
  }
}

std::optional<int> cli_dispatcher::run() const {
  if (wants_help()) {
    print_help();
    return 0;
  }
  if (wants_version()) {
    print_version();
    return 0;
  }
  if (positional_args.empty()) {
    print_help();
    return 2;
  }
  const std::string& command = positional_args[0];
  if (command == "serve") return std::nullopt;

  // Keep stdout for results; diagnostics go to stderr.
  trantor::Logger::setOutputFunction(
      [](const char* msg, const uint64_t len) { std::fwrite(msg, 1, static_cast<size_t>(len), stderr); },
      []() { std::fflush(stderr); });
  if (!has_flag("--verbose") && !str::truthy(std::getenv("SQLSCOPE_VERBOSE"))) trantor::Logger::setLogLevel(trantor::Logger::kWarn);

  return handle_command(command);
}

bool cli_dispatcher::has_flag(const std::string& flag) const {
  for (int i = 1; i < argc_state; ++i) {
    if (std::string_view(argv_state[i]) == flag) return true;
  }
  return false;
}

std::optional<std::string> cli_dispatcher::flag_value(const std::string& flag) const {
  for (int i = 1; i + 1 < argc_state; ++i) {
    if (std::string_view(argv_state[i]) == flag) return std::string(argv_state[i + 1]);
  }
  return std::nullopt;
}

bool cli_dispatcher::wants_help() const {
  return has_flag("-h") || has_flag("--help");
}

bool cli_dispatcher::wants_version() const {
  return has_flag("-v") || has_flag("--version");
}

void cli_dispatcher::print_help() const {
  std::cout << "sqlscope " << SQLSCOPE_VERSION << "\n\n"
            << "Usage:\n"
            << "  sqlscope <command> <database> [args] [options]\n"
            << "  sqlscope serve <database> [options]\n\n"
            << "Commands:\n"
            << "  tables <db>                 List tables and views with row counts\n"
            << "  columns <db> <table>        Column definitions\n"
            << "  indexes <db> <table>        Indexes and their columns\n"
            << "  fks <db> <table>            Foreign keys\n"
            << "  ddl <db> <name> [--raw]     Stored CREATE statement (formatted unless --raw)\n"
            << "  info <db>                   Engine settings, file size and name\n"
            << "  query <db> <sql>            Run SQL\n"
            << "  data <db> <table>           Page through a table (--limit, --offset)\n"
            << "  format <sql>                Pretty-print SQL\n"
            << "  serve <db>                  Start the HTTP/WebSocket service\n\n"
            << "Options:\n"
            << "  -h, --help          Show this help message\n"
            << "  -v, --version       Show version info\n"
            << "  --json              Print protocol JSON instead of text\n"
            << "  --limit <n>         Rows per page (default " << SQLSCOPE_DEFAULT_ROW_LIMIT << ")\n"
            << "  --offset <n>        Rows to skip\n"
            << "  --verbose           Log at INFO level to stderr\n\n"
            << "Serve options:\n"
            << "  --config <path>     Drogon config file\n"
            << "  --address <addr>    Listen address (default 127.0.0.1)\n"
            << "  --port <n>          Listen port (default " << SQLSCOPE_DEFAULT_PORT << ")\n"
            << "  --token <t|auto>    Require a bearer token; auto generates one\n"
            << "  --poll-ms <n>       Change poll interval, 0 disables\n\n"
            << std::flush;
}

void cli_dispatcher::print_version() const {
  std::cout << "sqlscope " << SQLSCOPE_VERSION << "\n"
            << "build " << SQLSCOPE_BUILD_NUMBER << " (" << SQLSCOPE_BUILD_TYPE << ")" << "\n"
            << "git " << SQLSCOPE_GIT_BRANCH << " @ " << SQLSCOPE_GIT_REV << "\n"
            << "compiled with " << SQLSCOPE_COMPILER_ID << " " << SQLSCOPE_COMPILER_VERSION
            << " on " << SQLSCOPE_BUILD_OS << "\n";
}

int cli_dispatcher::handle_command(const std::string& command) const {
  const bool want_json = has_flag("--json");
  const auto& args = positional_args;

  if (command == "format") {
    if (args.size() < 2) {
      std::cerr << "usage: sqlscope format <sql>\n";
      return 2;
    }
    try {
      std::cout << sqlfmt::format(args[1]) << '\n';
      return 0;
    } catch (const sqlfmt::format_error& e) {
      std::cerr << "format error: " << e.what() << '\n';
      return 1;
    }
  }

  static const std::set<std::string> needs_name = {"columns", "indexes", "fks", "ddl", "query", "data"};
  static const std::set<std::string> known = {"tables", "info", "columns", "indexes", "fks", "ddl", "query", "data"};
  if (!known.count(command)) {
    std::cerr << "unknown command: " << command << "\n";
    return 2;
  }
  if (args.size() < 2 || (needs_name.count(command) && args.size() < 3)) {
    std::cerr << "missing arguments; see sqlscope --help\n";
    return 2;
  }
  const std::string& db_path = args[1];
  int limit = row_limit;
  if (auto v = parse_int(flag_value("--limit")); v && *v > 0) limit = std::min(*v, SQLSCOPE_MAX_ROW_LIMIT);
  int offset = parse_int(flag_value("--offset")).value_or(0);

  db::ConnectionRegistry registry;
  db::QueryExecutor executor(limit);

  if (want_json) {
    static const std::map<std::string, std::string> protocol = {
        {"tables", "getTables"}, {"info", "getDatabaseInfo"}, {"columns", "getTableInfo"},
        {"indexes", "getIndexes"}, {"fks", "getConstraints"}, {"ddl", "getTableStructure"},
        {"query", "executeQuery"}, {"data", "getTableData"}};
    Json::Value request(Json::objectValue);
    request["command"] = protocol.at(command);
    if (command == "query") request["query"] = args[2];
    else if (needs_name.count(command)) request["tableName"] = args[2];
    if (command == "data") {
      request["limit"] = limit;
      request["offset"] = offset;
    }
    service::message_dispatcher dispatcher(registry, executor, db_path);
    Json::Value reply = dispatcher.handle(request);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::cout << Json::writeString(builder, reply) << std::endl;
    if (reply["command"].asString() == "error") return 1;
    const Json::Value& result = reply["result"];
    return (result.isObject() && result.isMember("error")) ? 1 : 0;
  }

  try {
    db::Connection& conn = registry.open(db_path);
    if (command == "tables") {
      std::cout << "name\ttype\trows\n";
      for (const auto& t : db::inspect::list_tables(conn)) {
        std::cout << t.name << '\t' << (t.kind == db::TableKind::View ? "view" : "table") << '\t';
        if (t.row_count) std::cout << *t.row_count;
        else if (t.kind == db::TableKind::Table) std::cout << "?";
        std::cout << '\n';
      }
      return 0;
    }
    if (command == "columns") {
      std::cout << "cid\tname\ttype\tnotnull\tdflt_value\tpk\n";
      for (const auto& c : db::inspect::columns(conn, args[2])) {
        std::cout << c.ordinal << '\t' << c.name << '\t' << c.declared_type << '\t'
                  << (c.not_null ? 1 : 0) << '\t'
                  << (c.default_value ? cell(*c.default_value) : std::string()) << '\t'
                  << c.primary_key_index << '\n';
      }
      return 0;
    }
    if (command == "indexes") {
      std::cout << "name\tunique\torigin\tpartial\tcolumns\n";
      for (const auto& ix : db::inspect::indexes(conn, args[2])) {
        std::string cols;
        for (const auto& c : ix.columns) {
          if (!cols.empty()) cols += ",";
          cols += c.name.empty() ? "<expr>" : c.name;
        }
        std::cout << ix.name << '\t' << (ix.is_unique ? 1 : 0) << '\t' << ix.origin << '\t'
                  << (ix.partial ? 1 : 0) << '\t' << cols << '\n';
      }
      return 0;
    }
    if (command == "fks") {
      std::cout << "id\tseq\ttable\tfrom\tto\ton_update\ton_delete\tmatch\n";
      for (const auto& fk : db::inspect::foreign_keys(conn, args[2])) {
        std::cout << fk.id << '\t' << fk.seq << '\t' << fk.to_table << '\t' << fk.from_column << '\t'
                  << fk.to_column << '\t' << fk.on_update << '\t' << fk.on_delete << '\t' << fk.match << '\n';
      }
      return 0;
    }
    if (command == "ddl") {
      std::string sql = db::inspect::ddl(conn, args[2]);
      if (!has_flag("--raw")) {
        try {
          sql = sqlfmt::format(sql);
        } catch (const sqlfmt::format_error& e) {
          LOG_WARN << "Error formatting SQL: " << e.what();
        }
      }
      std::cout << sql << '\n';
      return 0;
    }
    if (command == "info") {
      auto info = db::inspect::database_info(conn, db_path);
      for (const auto& setting : info.settings) {
        std::cout << setting.first << '\t' << (setting.second ? cell(*setting.second) : std::string("N/A")) << '\n';
      }
      std::cout << "fileSize\t" << info.file_size << '\n';
      std::cout << "filename\t" << info.filename << '\n';
      return 0;
    }
    db::QueryResult result = command == "query" ? executor.run(conn, args[2])
                                                : executor.paginate(conn, args[2], limit, offset);
    if (!result.ok()) {
      std::cerr << "error: " << *result.error << '\n';
      return 1;
    }
    print_result(result);
    return 0;
  } catch (const db::db_error& e) {
    std::cerr << "error: " << e.what() << '\n';
    return 1;
  }
}

}  // namespace sqlscope::app
