#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <sstream>
#include <string>

namespace xcore {
namespace common {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Key-value fields attached to a structured log entry. Values are rendered
 * with operator<< (booleans as true/false) at the time they are added.
 */
class LogContext {
public:
    LogContext& add(const std::string& key, const std::string& value) {
        fields_[key] = value;
        return *this;
    }

    template<typename T>
    LogContext& add(const std::string& key, const T& value) {
        std::ostringstream oss;
        oss << std::boolalpha << value;
        return add(key, oss.str());
    }

    const std::map<std::string, std::string>& get_fields() const { return fields_; }
    bool empty() const { return fields_.empty(); }

private:
    std::map<std::string, std::string> fields_;
};

/**
 * Process-wide logger used by every decision component.
 *
 * Messages use "{}" placeholders filled in argument order. A sink can be
 * installed to receive every entry that passes the level filter, which is how
 * hosts forward SDK logs into their own logging and how tests capture them.
 */
class Logger {
public:
    enum class OutputFormat {
        PLAIN,      // Human-readable format
        JSON,       // One JSON object per line
        LOGFMT      // key=value pairs
    };

    struct Config {
        LogLevel level = LogLevel::INFO;
        OutputFormat format = OutputFormat::PLAIN;
        bool enable_console_output = true;
        bool enable_file_output = false;
        std::string log_file_path = "xcore.log";
        // Entries are written by a background thread; the oldest are dropped
        // once async_buffer_size entries are pending
        bool enable_async_logging = false;
        size_t async_buffer_size = 1000;
        bool include_thread_id = true;
    };

    using LogSink = std::function<void(LogLevel level, const std::string& message)>;

    static void initialize(const std::string& name, const Config& config);
    static void shutdown();

    static void set_level(LogLevel level) { level_.store(level); }
    static LogLevel get_level() { return level_.load(); }
    static bool enabled(LogLevel level) { return level >= level_.load(); }

    static void set_format(OutputFormat format);
    static void set_sink(LogSink sink);

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, const Args&... args) {
        if (!enabled(level)) return;
        dispatch(level, format_message(format, args...), LogContext{});
    }

    static void log_structured(LogLevel level, const std::string& message, const LogContext& context);

    // Always emitted at ERROR, with the exception type and message added to the context
    static void log_error(const std::string& message, const std::exception& e, const LogContext& context = {});

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRIT";
        }
        return "UNKNOWN";
    }

    // Substitutes each "{}" in turn. Inserted text is never searched again;
    // surplus placeholders stay as written and surplus arguments are dropped.
    template<typename... Args>
    static std::string format_message(const std::string& format, const Args&... args) {
        std::string out;
        size_t cursor = 0;
        (substitute(out, format, cursor, args), ...);
        out.append(format, cursor, std::string::npos);
        return out;
    }

private:
    static std::atomic<LogLevel> level_;

    static void dispatch(LogLevel level, const std::string& message, const LogContext& context);

    template<typename T>
    static void substitute(std::string& out, const std::string& format, size_t& cursor, const T& value) {
        const size_t pos = format.find("{}", cursor);
        if (pos == std::string::npos) return;

        std::ostringstream oss;
        oss << std::boolalpha << value;
        out.append(format, cursor, pos - cursor);
        out += oss.str();
        cursor = pos + 2;
    }
};

#define LOG_TRACE(...) xcore::common::Logger::log(xcore::common::LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) xcore::common::Logger::log(xcore::common::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...) xcore::common::Logger::log(xcore::common::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARNING(...) xcore::common::Logger::log(xcore::common::LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERROR(...) xcore::common::Logger::log(xcore::common::LogLevel::ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) xcore::common::Logger::log(xcore::common::LogLevel::CRITICAL, __VA_ARGS__)

#define LOG_STRUCTURED(level, message, context) \
    xcore::common::Logger::log_structured(level, message, context)

#define LOG_ERROR_WITH_EXCEPTION(message, exception, context) \
    xcore::common::Logger::log_error(message, exception, context)

} // namespace common
} // namespace xcore
