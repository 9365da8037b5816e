// =============================================================================
// log.cpp - Leveled logger
// =============================================================================

#include "fairlaunch/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace fairlaunch {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_mutex;
std::ofstream g_file;

std::string timestamp_now() {
    char buf[64];
    std::time_t t = std::time(nullptr);
    std::tm tmv;
    localtime_r(&t, &tmv);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string(buf);
}

std::string format_args(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed < 0) return fmt;

    std::vector<char> buf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<size_t>(needed));
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    std::string msg = format_args(fmt, args);

    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& os = g_file.is_open() ? static_cast<std::ostream&>(g_file) : std::cerr;
    os << "[" << timestamp_now() << "][" << level_name(lvl) << "] " << msg << std::endl;
}

} // anonymous namespace

void set_level(Level lvl) {
    g_level.store(static_cast<int>(lvl));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load();
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    return std::nullopt;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off: return "OFF";
    }
    return "?";
}

void set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file.is_open()) g_file.close();
    if (path.empty()) return;

    g_file.open(path, std::ios::out | std::ios::app);
    if (!g_file.is_open()) {
        throw std::runtime_error("Cannot open log file: " + path);
    }
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Level::Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Level::Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Level::Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Level::Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Level::Error, fmt, args);
    va_end(args);
}

} // namespace log
} // namespace fairlaunch
