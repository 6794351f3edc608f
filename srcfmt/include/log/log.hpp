//! # srcfmt Logging
//!
//! A small structured logger shared by every srcfmt component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null sinks, text or JSON lines
//! - Thread-safe dispatch, so traversal workers can log freely
//! - Compile-time level elision via SRCFMT_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! SRCFMT_LOG_INFO("fmt", "Formatted " << path);
//! SRCFMT_LOG_DEBUG("walk", "Skipping symlink " << entry.path());
//! ```
//!
//! ## Module Tags
//!
//! | Tag        | Component                         |
//! |------------|-----------------------------------|
//! | `config`   | Configuration resolution          |
//! | `engine`   | External formatting engine        |
//! | `pipeline` | Per-file formatting pipeline      |
//! | `rewrite`  | Atomic file replacement           |
//! | `walk`     | Tree traversal and worker pool    |
//! | `fmt`      | Command-line front end            |

#ifndef SRCFMT_LOG_HPP
#define SRCFMT_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace srcfmt::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Returns the upper-case name for a log level (e.g., "DEBUG").
const char* level_name(LogLevel level);

/// Parses a log level name. Returns LogLevel::Info if the name is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "walk", "rewrite")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a capable terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends log lines to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything. Used by tests that exercise noisy code paths.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses specs like "walk=trace,rewrite=debug,*=warn". A bare module name
/// without "=level" enables everything for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module, used by the logger's fast path.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Path to log file (empty = no file)
    bool console = true;     ///< Enable stderr output
    bool colors = true;      ///< Enable ANSI colors on stderr
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Until `Logger::init()` is called the logger has no sinks and drops
/// every record, which keeps library code silent when embedded in tests.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Subsequent records are dropped.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Returns milliseconds since epoch.
int64_t epoch_ms();

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// and falls back to the SRCFMT_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true for arguments consumed by `parse_log_options`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef SRCFMT_MIN_LOG_LEVEL
#define SRCFMT_MIN_LOG_LEVEL 0
#endif

/// Internal macro — do not use directly.
#define SRCFMT_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= SRCFMT_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::srcfmt::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SRCFMT_LOG_TRACE(module, msg) SRCFMT_LOG_IMPL(::srcfmt::log::LogLevel::Trace, module, msg)
#define SRCFMT_LOG_DEBUG(module, msg) SRCFMT_LOG_IMPL(::srcfmt::log::LogLevel::Debug, module, msg)
#define SRCFMT_LOG_INFO(module, msg) SRCFMT_LOG_IMPL(::srcfmt::log::LogLevel::Info, module, msg)
#define SRCFMT_LOG_WARN(module, msg) SRCFMT_LOG_IMPL(::srcfmt::log::LogLevel::Warn, module, msg)
#define SRCFMT_LOG_ERROR(module, msg) SRCFMT_LOG_IMPL(::srcfmt::log::LogLevel::Error, module, msg)
#define SRCFMT_LOG_FATAL(module, msg) SRCFMT_LOG_IMPL(::srcfmt::log::LogLevel::Fatal, module, msg)

} // namespace srcfmt::log

#endif // SRCFMT_LOG_HPP
