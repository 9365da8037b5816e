#ifndef FAIRLAUNCH_LOG_HPP
#define FAIRLAUNCH_LOG_HPP

#include <optional>
#include <string>
#include <string_view>

namespace fairlaunch {

// =============================================================================
// Logging
//
// Leveled, thread-safe, printf-style. Lines look like
//   [2024-01-01 12:00:00][INFO] message
// and go to stderr unless a log file is set.
// =============================================================================

namespace log {

enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

void set_level(Level level);
Level level();
bool enabled(Level level);

// "trace", "debug", "info", "warn"/"warning", "error", "off"
std::optional<Level> parse_level(std::string_view name);
const char* level_name(Level level);

// Append to `path`; an empty path switches back to stderr.
// Throws std::runtime_error if the file cannot be opened.
void set_file(const std::string& path);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

} // namespace log

} // namespace fairlaunch

#endif // FAIRLAUNCH_LOG_HPP
