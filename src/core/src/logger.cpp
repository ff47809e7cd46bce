/**
 * Logging implementation
 *
 * Process-wide sink list and named logger registry guarded by one mutex.
 */

#include "petalite/core/logger.hpp"
#include <atomic>
#include <ctime>
#include <mutex>
#include <unordered_map>

namespace petalite {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    std::unique_ptr<Logger> default_logger;
    std::atomic<LogLevel> global_level{LogLevel::Info};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

// [2024-05-01 12:00:00.042] [LEVEL] [logger] message
std::string format_line(const LogRecord& record, std::string_view level_prefix,
                        std::string_view level_suffix) {
    auto time = std::chrono::system_clock::to_time_t(record.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&time, &local);
    char clock[32];
    std::strftime(clock, sizeof(clock), "%Y-%m-%d %H:%M:%S", &local);

    std::string line = std::format("[{}.{:03}] {}[{}]{} ", clock, ms, level_prefix,
                                   log_level_name(record.level), level_suffix);
    if (!record.logger_name.empty()) {
        line += std::format("[{}] ", record.logger_name);
    }
    line += record.message;
    return line;
}

} // anonymous namespace

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    std::string_view color;
    if (m_use_colors) {
        switch (record.level) {
            case LogLevel::Trace: color = "\033[90m"; break;
            case LogLevel::Debug: color = "\033[36m"; break;
            case LogLevel::Info:  color = "\033[32m"; break;
            case LogLevel::Warn:  color = "\033[33m"; break;
            case LogLevel::Error: color = "\033[31m"; break;
            case LogLevel::Off:   break;
        }
    }

    std::string line = format_line(record, color, color.empty() ? "" : "\033[0m");
    if (record.level <= LogLevel::Debug) {
        line += std::format(" ({}:{})", record.location.file_name(), record.location.line());
    }
    line += '\n';

    std::FILE* out = record.level >= LogLevel::Warn ? stderr : stdout;
    std::fputs(line.c_str(), out);
}

void ConsoleSink::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

FileSink::FileSink(const char* filename) : m_file(std::fopen(filename, "a")) {}

FileSink::~FileSink() {
    if (m_file) {
        std::fclose(m_file);
    }
}

void FileSink::write(const LogRecord& record) {
    if (!m_file) {
        return;
    }
    std::string line = format_line(record, "", "");
    line += std::format(" ({}:{})\n", record.location.file_name(), record.location.line());
    std::fputs(line.c_str(), m_file);
}

void FileSink::flush() {
    if (m_file) {
        std::fflush(m_file);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string_view name) : m_name(name) {}

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= m_level &&
           level >= state().global_level.load(std::memory_order_relaxed);
}

void Logger::log(LogLevel level, std::string_view msg, std::source_location loc) {
    if (!is_enabled(level)) {
        return;
    }

    LogRecord record{level, msg, m_name, loc, std::chrono::system_clock::now()};

    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Process-wide configuration
// ============================================================================

namespace logging {

namespace {

void install_locked(LoggingState& s, std::vector<std::unique_ptr<LogSink>> sinks) {
    s.sinks = std::move(sinks);
    s.default_logger = std::make_unique<Logger>("petalite");
    s.initialized = true;
}

} // anonymous namespace

void init() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.initialized) {
        return;
    }
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    install_locked(s, std::move(sinks));
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized) {
        install_locked(s, std::move(sinks));
    }
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->flush();
    }
    s.sinks.clear();
    s.loggers.clear();
    s.default_logger.reset();
    s.initialized = false;
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    state().global_level.store(level, std::memory_order_relaxed);
}

LogLevel level() {
    return state().global_level.load(std::memory_order_relaxed);
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    auto [it, inserted] = s.loggers.try_emplace(std::string(name));
    if (inserted) {
        it->second = std::make_unique<Logger>(name);
    }
    return *it->second;
}

Logger& default_logger() {
    init();
    return *state().default_logger;
}

} // namespace logging

} // namespace petalite
