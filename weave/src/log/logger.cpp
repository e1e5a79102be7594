//! # Logger
//!
//! Record formatting, the stderr sink, module filtering and the logger
//! singleton.

#include "log/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <utility>

namespace weave::log {

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

LogLevel parse_level(std::string_view s) {
    static const std::pair<std::string_view, LogLevel> names[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug}, {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},   {"error", LogLevel::Error}, {"off", LogLevel::Off},
    };
    std::string lower(s);
    for (auto& c : lower) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    for (const auto& [name, level] : names) {
        if (lower == name) {
            return level;
        }
    }
    return LogLevel::Warn;
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void write_clock_time(std::ostream& out, int64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf;
    localtime_r(&seconds, &tm_buf);
    out << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << timestamp_ms % 1000 << std::setfill(' ');
}

void write_json_escaped(std::ostream& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            out << c;
        }
    }
}

} // namespace

std::string format_text(const LogRecord& record) {
    std::ostringstream oss;
    write_clock_time(oss, record.timestamp_ms);
    oss << ' ' << std::left << std::setw(5) << level_name(record.level) << " [" << record.module
        << "] " << record.message;
    return oss.str();
}

std::string format_json(const LogRecord& record) {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":\"";
    write_json_escaped(oss, record.module);
    oss << "\",\"msg\":\"";
    write_json_escaped(oss, record.message);
    oss << "\"}";
    return oss.str();
}

void StderrSink::write(const LogRecord& record) {
    std::string line = format_ == LogFormat::JSON ? format_json(record) : format_text(record);
    line += '\n';
    std::cerr << line;
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');
        if (eq != std::string_view::npos) {
            auto module = token.substr(0, eq);
            auto level = parse_level(token.substr(eq + 1));
            if (module == "*") {
                default_level_ = level;
            } else {
                module_levels_[std::string(module)] = level;
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }
        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto it = module_levels_.find(std::string(module));
    return level >= (it != module_levels_.end() ? it->second : default_level_);
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min) {
            min = level;
        }
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    configure(log_config_from_env());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(LogLevel::Warn);
    filter_.parse(config.filter_spec);
    min_level_ = filter_.min_level();
    sink_ = std::make_unique<StderrSink>(config.format);
}

std::unique_ptr<LogSink> Logger::set_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::swap(sink_, sink);
    return sink;
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_ && filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message) {
    LogRecord record{level, module, std::move(message), epoch_ms()};
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_->write(record);
    }
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(LogLevel::Warn);
    filter_.parse(spec);
    min_level_ = filter_.min_level();
}

} // namespace weave::log
