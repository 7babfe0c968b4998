#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>

#include "logging/logger.hpp"

namespace tether {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::vector<std::string> &valid_keys, const std::string &scope) {
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown " << scope << " key: '" << key << "' (will be ignored)");
        }
    }
}

}  // namespace

HostConfig default_config() { return HostConfig{}; }

bool validate_config(const HostConfig &config, std::string &error) {
    if (config.backend.host.empty()) {
        error = "backend.host must not be empty";
        return false;
    }
    if (config.backend.port < 1 || config.backend.port > 65535) {
        error = "backend.port must be between 1 and 65535";
        return false;
    }
    if (config.backend.command.empty()) {
        error = "backend.command must not be empty";
        return false;
    }
    for (const auto &[name, value] : config.backend.env) {
        if (name.empty() || name.find('=') != std::string::npos) {
            error = "backend.env has invalid variable name: '" + name + "'";
            return false;
        }
    }

    // Same names --log-level accepts
    if (!logging::parse_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, HostConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            // Empty file: keep defaults
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, {"backend", "logging"}, "top-level");

        if (yaml["backend"]) {
            const auto &backend = yaml["backend"];
            warn_unknown_keys(backend, {"host", "port", "command", "args", "working_dir", "env"}, "backend");

            if (backend["host"]) {
                config.backend.host = backend["host"].as<std::string>();
            }
            if (backend["port"]) {
                config.backend.port = backend["port"].as<int>();
            }
            if (backend["command"]) {
                config.backend.command = backend["command"].as<std::string>();
            }

            // args supports scalar or sequence
            if (backend["args"]) {
                const auto &args_node = backend["args"];
                config.backend.args.clear();
                if (args_node.IsSequence()) {
                    for (const auto &arg : args_node) {
                        config.backend.args.push_back(arg.as<std::string>());
                    }
                } else if (args_node.IsScalar()) {
                    config.backend.args.push_back(args_node.as<std::string>());
                }
            }

            if (backend["working_dir"]) {
                config.backend.working_dir = backend["working_dir"].as<std::string>();
            }

            if (backend["env"]) {
                if (!backend["env"].IsMap()) {
                    error = "backend.env must be a mapping of NAME: value";
                    return false;
                }
                config.backend.env.clear();
                for (const auto &entry : backend["env"]) {
                    config.backend.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
                }
            }
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream backend_msg;
        backend_msg << "[Config] Backend: " << config.backend.command;
        for (const auto &arg : config.backend.args) {
            backend_msg << " " << arg;
        }
        backend_msg << " (" << config.backend.host << ":" << config.backend.port << ")";
        LOG_INFO(backend_msg.str());

        if (!config.backend.working_dir.empty()) {
            LOG_INFO("[Config] Backend working dir: " << config.backend.working_dir);
        }
        if (!config.backend.env.empty()) {
            LOG_DEBUG("[Config] Backend env overrides: " << config.backend.env.size());
        }
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace tether
