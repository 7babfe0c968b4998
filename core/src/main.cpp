// Tether host
// Keeps the backend sidecar alive for the session and kills it on exit

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/host_runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "tether.yaml";  // Default
    bool config_explicit = false;
    std::string log_level_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            config_explicit = true;
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
            config_explicit = true;
        } else if (arg.rfind("--log-level=", 0) == 0) {
            log_level_override = arg.substr(12);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: tether-host [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH       Path to config file (default: tether.yaml)\n";
            std::cerr << "  --log-level=LEVEL   debug, info, warn, error or none (overrides config)\n";
            std::cerr << "  --help, -h          Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!log_level_override.empty() && !tether::logging::parse_level(log_level_override)) {
        std::cerr << "ERROR: Invalid log level: " << log_level_override << "\n";
        return 1;
    }

    tether::runtime::HostConfig config = tether::runtime::default_config();
    std::string error;

    if (std::filesystem::exists(config_path)) {
        LOG_INFO("Loading config: " << config_path);
        if (!tether::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    } else if (config_explicit) {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    } else {
        LOG_INFO("No " << config_path << " found, using built-in defaults");
    }

    if (!log_level_override.empty()) {
        config.logging.level = log_level_override;
    }
    tether::logging::Logger::set_level(
        tether::logging::parse_level(config.logging.level).value_or(tether::logging::Level::LVL_INFO));

    LOG_INFO("Tether host starting...");

    // Installed before startup so a Ctrl-C during spawn still reaches run()
    tether::runtime::SignalHandler::install();

    tether::runtime::HostRuntime host(config);

    if (!host.initialize(error)) {
        LOG_ERROR("Startup failed: " << error);
        return 1;
    }

    LOG_INFO("Host ready");

    host.run();
    host.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
