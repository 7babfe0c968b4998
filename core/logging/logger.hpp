#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace tether {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Process-wide stderr logger. Records below the threshold are dropped.
class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();
    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Case-insensitive: debug, info, warn, error, none
std::optional<Level> parse_level(const std::string &level_str);
std::string level_to_string(Level level);

}  // namespace logging
}  // namespace tether

#define LOG_INTERNAL(lvl, msg)                                                    \
    do {                                                                          \
        if ((lvl) >= tether::logging::Logger::level()) {                          \
            std::stringstream ss;                                                 \
            ss << msg;                                                            \
            tether::logging::Logger::log((lvl), __FILE__, __LINE__, ss.str());    \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(tether::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(tether::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(tether::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(tether::logging::Level::LVL_ERROR, msg)
