//! # KIR Logging
//!
//! Module-tagged structured logging shared by every midend component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering ("opt=debug,regalloc=trace,*=warn")
//! - Pluggable output sinks (Console, File, Null, Multi, Capture)
//! - Thread-safe dispatch; functions may be allocated on worker threads
//! - Compile-time level elision via KIR_MIN_LOG_LEVEL
//!
//! ## Module Tags
//!
//! | Tag        | Component                         |
//! |------------|-----------------------------------|
//! | `build`    | typed AST lowering                |
//! | `verify`   | IR verifier                       |
//! | `ssa`      | mem2reg and phi insertion         |
//! | `opt`      | pass manager and passes           |
//! | `regalloc` | liveness and linear scan          |
//! | `backend`  | backend dispatch                  |
//! | `driver`   | compile pipeline                  |
//!
//! ## Usage
//!
//! ```cpp
//! KIR_LOG_DEBUG("opt", "inlining refused: " << callee << " is on the inline chain");
//! KIR_LOG_INFO("driver", "compiled " << module.name << " in " << rounds << " rounds");
//! ```

#ifndef KIR_LOG_HPP
#define KIR_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kir::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-instruction tracing
    Debug = 1, ///< Pass decisions, refusals
    Info = 2,  ///< Pipeline milestones
    Warn = 3,  ///< Suspicious but recoverable input
    Error = 4, ///< Diagnostics surfaced to the driver
    Fatal = 5, ///< Internal compiler errors
    Off = 6    ///< Disables all logging
};

/// Returns the short string name for a log level (e.g., "TRACE", "DEBUG").
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a log level from a string (lowercase or uppercase).
/// Returns LogLevel::Info if the string is not recognized.
[[nodiscard]] auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;       ///< Severity level
    std::string module;   ///< Module tag (e.g., "opt", "regalloc")
    std::string message;  ///< Formatted message text
    const char* file;     ///< Source file (__FILE__)
    int line;             ///< Source line (__LINE__)
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_enabled_;
};

/// File sink. Flushes eagerly on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans out log records to multiple child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    [[nodiscard]] auto size() const -> size_t {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Keeps records in memory.
///
/// The record buffer is shared, so a test can hand the sink to the Logger and
/// keep a handle on the buffer to inspect what was logged.
class CaptureSink : public LogSink {
public:
    using Buffer = std::vector<LogRecord>;

    CaptureSink() : records_(std::make_shared<Buffer>()) {}

    void write(const LogRecord& record) override;
    void flush() override {}

    [[nodiscard]] auto records() const -> std::shared_ptr<Buffer> {
        return records_;
    }

private:
    std::shared_ptr<Buffer> records_;
    std::mutex mutex_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "opt=trace,ssa=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level"
    /// Bare module names enable Trace for that module.
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Minimum configured level across all modules and the default.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn; ///< Global minimum log level
    std::string filter_spec;         ///< Module filter string
    std::string log_file;            ///< Path to log file (empty = no file)
    bool console = true;             ///< Enable console (stderr) output
    bool colors = true;              ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Works without explicit initialization: until `init()` is called it logs
/// Warn and above to stderr.
class Logger {
public:
    /// Replace sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before formatting the message.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove every sink, including the default console sink.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel;

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Milliseconds since epoch (for LogRecord timestamps).
[[nodiscard]] auto epoch_ms() -> int64_t;

/// Current wall-clock time as "HH:MM:SS.mmm".
[[nodiscard]] auto timestamp() -> std::string;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related options from argv.
/// Extracts: --log-level=, --log-filter=, --log-file=, -v/-vv/-vvv, -q
/// Falls back to the KIR_LOG environment variable.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef KIR_MIN_LOG_LEVEL
#define KIR_MIN_LOG_LEVEL 0
#endif

#define KIR_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= KIR_MIN_LOG_LEVEL) {                                        \
            auto& logger_ = ::kir::log::Logger::instance();                                        \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: KIR_LOG_TRACE("module", "message " << value);
#define KIR_LOG_TRACE(module, msg) KIR_LOG_IMPL(::kir::log::LogLevel::Trace, module, msg)
#define KIR_LOG_DEBUG(module, msg) KIR_LOG_IMPL(::kir::log::LogLevel::Debug, module, msg)
#define KIR_LOG_INFO(module, msg) KIR_LOG_IMPL(::kir::log::LogLevel::Info, module, msg)
#define KIR_LOG_WARN(module, msg) KIR_LOG_IMPL(::kir::log::LogLevel::Warn, module, msg)
#define KIR_LOG_ERROR(module, msg) KIR_LOG_IMPL(::kir::log::LogLevel::Error, module, msg)
#define KIR_LOG_FATAL(module, msg) KIR_LOG_IMPL(::kir::log::LogLevel::Fatal, module, msg)

} // namespace kir::log

#endif // KIR_LOG_HPP
