#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace skysync {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Helper to convert config strings ("debug", "info", ...) to Level
Level string_to_level(const std::string &level_str);

// Inverse of string_to_level, lowercase
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace skysync

// Macros handle string building so call sites can stream values
#define LOG_INTERNAL(lvl, msg)                                                 \
    do {                                                                       \
        if ((lvl) >= skysync::logging::Logger::level()) {                      \
            std::stringstream ss;                                              \
            ss << msg;                                                         \
            skysync::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str());   \
        }                                                                      \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(skysync::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(skysync::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(skysync::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(skysync::logging::Level::LVL_ERROR, msg)
