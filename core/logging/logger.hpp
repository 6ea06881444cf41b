#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace inventory {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Config parsing helpers. parse_level() rejects unknown names,
// string_to_level() falls back to INFO.
std::optional<Level> parse_level(const std::string &level_str);
Level string_to_level(const std::string &level_str);

}  // namespace logging
}  // namespace inventory

// Message is only formatted when the level passes the threshold
#define LOG_INTERNAL(lvl, msg)                                                   \
    do {                                                                         \
        if ((lvl) >= inventory::logging::Logger::level()) {                      \
            std::stringstream log_ss_;                                           \
            log_ss_ << msg;                                                      \
            inventory::logging::Logger::log(lvl, __FILE__, __LINE__, log_ss_.str()); \
        }                                                                        \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(inventory::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(inventory::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(inventory::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(inventory::logging::Level::LVL_ERROR, msg)
