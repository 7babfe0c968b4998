#pragma once

#include <map>
#include <string>
#include <vector>

namespace tether {
namespace runtime {

// Backend sidecar section (backend: in YAML)
struct BackendConfig {
    std::string host = "127.0.0.1";             // Address the backend binds and the prober connects to
    int port = 3000;                            // Backend listen port
    std::string command = "elizaos";            // Executable name (PATH lookup) or path
    std::vector<std::string> args{"start"};     // Command-line arguments
    std::string working_dir;                    // Empty: inherit from host
    std::map<std::string, std::string> env;     // Extra environment for the child
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

struct HostConfig {
    BackendConfig backend;
    LoggingConfig logging;
};

// Reference behavior: 127.0.0.1:3000, "elizaos start"
HostConfig default_config();

// Loads configuration from a YAML file on top of the defaults
bool load_config(const std::string &config_path, HostConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const HostConfig &config, std::string &error);

}  // namespace runtime
}  // namespace tether
