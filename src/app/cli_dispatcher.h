#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sqlscope::app {

// One-shot commands run against a database file from the shell. `serve` is not
// handled here: run() returns nullopt for it so the caller can start the server.
class cli_dispatcher {
public:
  cli_dispatcher(int argc_value, char** argv_value, int row_limit_value);
  std::optional<int> run() const;

  // Positional arguments (flags and their values removed).
  const std::vector<std::string>& positionals() const { return positional_args; }

private:
  bool has_flag(const std::string& flag) const;
  std::optional<std::string> flag_value(const std::string& flag) const;

  bool wants_help() const;
  bool wants_version() const;
  void print_help() const;
  void print_version() const;

  int handle_command(const std::string& command) const;

  int argc_state;
  char** argv_state;
  int row_limit;
  std::vector<std::string> positional_args;
};

}  // namespace sqlscope::app
