#pragma once

namespace sqlscope::app {

// Resolves configuration, runs one-shot CLI commands, or starts the Drogon server.
class bootstrap {
public:
  bootstrap(int argc_value, char** argv_value);
  int execute();

private:
  int argc_;
  char** argv_;
};

}  // namespace sqlscope::app
