#include "gatefile/core/logging.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

namespace gatefile {

// ============================================================================
// Log Level Utilities
// ============================================================================

std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Console Sink
// ============================================================================

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";      // Gray
        case LogLevel::Debug: return "\033[36m";      // Cyan
        case LogLevel::Info:  return "\033[32m";      // Green
        case LogLevel::Warn:  return "\033[33m";      // Yellow
        case LogLevel::Error: return "\033[31m";      // Red
        case LogLevel::Fatal: return "\033[35m";      // Magenta
        default: return "\033[0m";
    }
}

// UTC, millisecond precision
std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t_val, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // anonymous namespace

void ConsoleSink::write(const LogEntry& entry) {
    std::ostringstream oss;

    oss << format_timestamp(entry.timestamp) << " ";

    if (colored_) {
        oss << level_color(entry.level);
    }
    oss << "[" << log_level_name(entry.level) << "]";
    if (colored_) {
        oss << "\033[0m";
    }

    if (!entry.logger_name.empty()) {
        oss << " [" << entry.logger_name << "]";
    }

    oss << " " << entry.message;

    for (const auto& [key, value] : entry.fields) {
        oss << " " << key << "=" << value;
    }

    oss << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << oss.str();
}

// ============================================================================
// JSON Sink
// ============================================================================

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::write(const LogEntry& entry) {
    nlohmann::json line = {
        {"timestamp", format_timestamp(entry.timestamp)},
        {"level", std::string(log_level_name(entry.level))},
        {"message", entry.message},
    };
    if (!entry.logger_name.empty()) {
        line["logger"] = entry.logger_name;
    }
    for (const auto& [key, value] : entry.fields) {
        line[key] = value;
    }

    // Replace invalid UTF-8 rather than throwing from a log call
    auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << '\n';
}

void JsonSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    return *this;
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string message) const {
    if (!is_enabled(level)) return;
    log(entry(level, std::move(message)));
}

LogEntry Logger::entry(LogLevel level, std::string message) const {
    LogEntry e;
    e.level = level;
    e.timestamp = std::chrono::system_clock::now();
    e.message = std::move(message);
    e.logger_name = name_;
    return e;
}

void Logger::log(const LogEntry& entry) const {
    if (!is_enabled(entry.level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

// ============================================================================
// Global Logger
// ============================================================================

Logger& default_logger() {
    static Logger& logger = [] () -> Logger& {
        static Logger instance("gatefile");
        instance.add_sink(std::make_shared<ConsoleSink>());
        return instance;
    }();
    return logger;
}

} // namespace gatefile
