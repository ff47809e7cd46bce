#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdio>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace petalite {

// ============================================================================
// Levels and records
// ============================================================================

enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    std::source_location location;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Warnings and errors go to stderr, the rest to stdout
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends to the named file; a file that cannot be opened drops records
class FileSink : public LogSink {
public:
    explicit FileSink(const char* filename);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const { return m_file != nullptr; }

private:
    std::FILE* m_file{nullptr};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name);

    void log(LogLevel level, std::string_view msg,
             std::source_location loc = std::source_location::current());

    // Formats only when the level passes both filters
    template<typename... Args>
    void log_fmt(LogLevel level, std::source_location loc,
                 std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(level)) {
            log(level, std::format(fmt, std::forward<Args>(args)...), loc);
        }
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Debug, msg, loc);
    }
    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Info, msg, loc);
    }
    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Warn, msg, loc);
    }
    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Error, msg, loc);
    }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Process-wide configuration
// ============================================================================

namespace logging {

// Installs a console sink unless already initialized
void init();
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops every sink and named logger
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

// Minimum level for every logger (default Info)
void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

[[nodiscard]] Logger& get(std::string_view name);

// The "petalite" logger used by the macros; initializes on first use
[[nodiscard]] Logger& default_logger();

} // namespace logging

// ============================================================================
// Convenience macros
// ============================================================================

#define PETALITE_LOG_DEBUG(msg) ::petalite::logging::default_logger().debug(msg)
#define PETALITE_LOG_INFO(msg)  ::petalite::logging::default_logger().info(msg)
#define PETALITE_LOG_WARN(msg)  ::petalite::logging::default_logger().warn(msg)
#define PETALITE_LOG_ERROR(msg) ::petalite::logging::default_logger().error(msg)

#define PETALITE_LOG_AT_FMT(level, ...) \
    ::petalite::logging::default_logger().log_fmt(level, std::source_location::current(), __VA_ARGS__)

#define PETALITE_LOG_DEBUG_FMT(...) PETALITE_LOG_AT_FMT(::petalite::LogLevel::Debug, __VA_ARGS__)
#define PETALITE_LOG_INFO_FMT(...)  PETALITE_LOG_AT_FMT(::petalite::LogLevel::Info, __VA_ARGS__)
#define PETALITE_LOG_WARN_FMT(...)  PETALITE_LOG_AT_FMT(::petalite::LogLevel::Warn, __VA_ARGS__)
#define PETALITE_LOG_ERROR_FMT(...) PETALITE_LOG_AT_FMT(::petalite::LogLevel::Error, __VA_ARGS__)

} // namespace petalite
