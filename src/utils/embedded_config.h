#pragma once
#include <string>

namespace sqlscope::config {

// Returns the embedded drogon.json default content.
const std::string& drogon_default_json();

// Build embedded config with an overridden listener.
std::string drogon_build_config_json(const std::string& address, int port);

}
