//! # Logging
//!
//! Module-tagged logging for weave components, written to stderr.
//!
//! The logger configures itself from the environment on first use:
//!
//! - `WEAVE_LOG=debug` sets the level for every module
//! - `WEAVE_LOG=resolve=trace,*=warn` sets per-module levels
//! - `WEAVE_LOG_FORMAT=json` switches to one JSON object per line
//!
//! Unset means Warn, so reported issues are visible by default.
//!
//! ```cpp
//! WEAVE_LOG_DEBUG("resolve", "resolving " << request << " in " << dir);
//! ```
//!
//! Module tags in use: `query`, `fs`, `resolve`, `context`, `module`,
//! `transition`, `graph`, `analysis`, `emit`.

#ifndef WEAVE_LOG_HPP
#define WEAVE_LOG_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace weave::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5 ///< Disables logging
};

/// Upper-case name, e.g. "WARN".
const char* level_name(LogLevel level);

/// Parses a level name in either case. Unknown names give Warn.
LogLevel parse_level(std::string_view s);

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

enum class LogFormat { Text, JSON };

/// `HH:MM:SS.mmm LEVEL [module] message`, no trailing newline.
std::string format_text(const LogRecord& record);

/// `{"ts":..,"level":..,"module":..,"msg":..}`, no trailing newline.
std::string format_json(const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

/// The default sink.
class StderrSink : public LogSink {
public:
    explicit StderrSink(LogFormat format = LogFormat::Text) : format_(format) {}

    void write(const LogRecord& record) override;

private:
    LogFormat format_;
};

// ============================================================================
// Filter and Configuration
// ============================================================================

/// Per-module levels parsed from `"resolve=trace,emit=debug,*=warn"`.
/// A bare module name enables everything for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    /// Lowest level any module accepts.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Warn;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

struct LogConfig {
    std::string filter_spec = "*=warn";
    LogFormat format = LogFormat::Text;
};

/// Reads `WEAVE_LOG` and `WEAVE_LOG_FORMAT`. A single level name becomes
/// `*=<level>`.
LogConfig log_config_from_env();

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. The first `instance()` call applies
/// `log_config_from_env()`.
class Logger {
public:
    static Logger& instance();

    void configure(const LogConfig& config);

    /// Replaces the sink and returns the previous one.
    std::unique_ptr<LogSink> set_sink(std::unique_ptr<LogSink> sink);

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, std::string message);

    void set_filter(std::string_view spec);

private:
    Logger();

    LogFilter filter_;
    LogLevel min_level_ = LogLevel::Warn;
    std::unique_ptr<LogSink> sink_;
    mutable std::mutex mutex_;
};

#define WEAVE_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        auto& logger_ = ::weave::log::Logger::instance();                                          \
        if (logger_.should_log(level, module_str)) {                                               \
            std::ostringstream oss_;                                                               \
            oss_ << msg;                                                                           \
            logger_.log(level, module_str, oss_.str());                                            \
        }                                                                                          \
    } while (0)

#define WEAVE_LOG_TRACE(module, msg) WEAVE_LOG_IMPL(::weave::log::LogLevel::Trace, module, msg)
#define WEAVE_LOG_DEBUG(module, msg) WEAVE_LOG_IMPL(::weave::log::LogLevel::Debug, module, msg)
#define WEAVE_LOG_INFO(module, msg) WEAVE_LOG_IMPL(::weave::log::LogLevel::Info, module, msg)
#define WEAVE_LOG_WARN(module, msg) WEAVE_LOG_IMPL(::weave::log::LogLevel::Warn, module, msg)
#define WEAVE_LOG_ERROR(module, msg) WEAVE_LOG_IMPL(::weave::log::LogLevel::Error, module, msg)

} // namespace weave::log

#endif // WEAVE_LOG_HPP
