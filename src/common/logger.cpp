#include "common/logger.hpp"

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <typeinfo>
#include <utility>

#include <nlohmann/json.hpp>

namespace xcore {
namespace common {

std::atomic<LogLevel> Logger::level_{LogLevel::INFO};

namespace {

struct Entry {
    LogLevel level;
    std::string message;
    LogContext context;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;
};

// Everything behind the static Logger facade. Output settings, the file and
// the sink are guarded by write_mutex; the pending queue and writer thread by
// queue_mutex.
struct State {
    std::mutex write_mutex;
    std::string name = "xcore";
    Logger::Config config;
    std::ofstream file;
    Logger::LogSink sink;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Entry> pending;
    size_t pending_limit = 0;
    bool stopping = false;
    std::thread writer;
};

State& state() {
    static State instance;
    return instance;
}

// Set while this thread runs the sink. Entries logged from inside the sink are
// written synchronously and not handed back to it.
thread_local bool inside_sink = false;

class SinkCall {
public:
    SinkCall() { inside_sink = true; }
    ~SinkCall() { inside_sink = false; }

    SinkCall(const SinkCall&) = delete;
    SinkCall& operator=(const SinkCall&) = delete;
};

// "2024-01-31 12:00:00.123" in local time, or ISO-8601 with a Z suffix in UTC
std::string format_timestamp(std::chrono::system_clock::time_point timestamp, bool utc) {
    const auto seconds = std::chrono::system_clock::to_time_t(timestamp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm parts{};
    if (utc) {
        gmtime_r(&seconds, &parts);
    } else {
        localtime_r(&seconds, &parts);
    }

    std::ostringstream oss;
    oss << std::put_time(&parts, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

std::string render_plain(const State& s, const Entry& entry) {
    std::ostringstream line;
    line << format_timestamp(entry.timestamp, false)
         << " [" << Logger::level_to_string(entry.level) << "] [" << s.name << "]";
    if (s.config.include_thread_id) {
        line << " [" << entry.thread_id << "]";
    }
    line << ' ' << entry.message;

    const char* separator = " {";
    for (const auto& [key, value] : entry.context.get_fields()) {
        line << separator << key << '=' << value;
        separator = ", ";
    }
    if (!entry.context.empty()) {
        line << '}';
    }
    return line.str();
}

std::string render_json(const State& s, const Entry& entry) {
    nlohmann::json record;
    record["timestamp"] = format_timestamp(entry.timestamp, true);
    record["level"] = Logger::level_to_string(entry.level);
    record["logger"] = s.name;
    record["message"] = entry.message;
    if (s.config.include_thread_id) {
        std::ostringstream tid;
        tid << entry.thread_id;
        record["thread_id"] = tid.str();
    }
    for (const auto& [key, value] : entry.context.get_fields()) {
        record[key] = value;
    }
    return record.dump();
}

std::string render_logfmt(const State& s, const Entry& entry) {
    std::ostringstream line;
    line << "timestamp=" << format_timestamp(entry.timestamp, true)
         << " level=" << Logger::level_to_string(entry.level)
         << " logger=" << s.name
         << " message=" << std::quoted(entry.message);
    if (s.config.include_thread_id) {
        line << " thread_id=" << entry.thread_id;
    }
    for (const auto& [key, value] : entry.context.get_fields()) {
        line << ' ' << key << '=' << std::quoted(value);
    }
    return line.str();
}

std::string render(const State& s, const Entry& entry) {
    switch (s.config.format) {
        case Logger::OutputFormat::JSON: return render_json(s, entry);
        case Logger::OutputFormat::LOGFMT: return render_logfmt(s, entry);
        case Logger::OutputFormat::PLAIN: break;
    }
    return render_plain(s, entry);
}

void write_line(State& s, const Entry& entry) {
    const bool to_file = s.file.is_open();
    if (!s.config.enable_console_output && !to_file) {
        return;
    }

    const std::string line = render(s, entry);
    if (s.config.enable_console_output) {
        std::cout << line << '\n';
    }
    if (to_file) {
        s.file << line << '\n';
        s.file.flush();
    }
}

void emit(const Entry& entry) {
    State& s = state();
    Logger::LogSink sink;
    {
        std::lock_guard<std::mutex> lock(s.write_mutex);
        if (!inside_sink) {
            sink = s.sink;
        }
        write_line(s, entry);
    }

    // Called unlocked so the sink may log, or replace itself, without deadlocking
    if (sink) {
        SinkCall call;
        sink(entry.level, entry.message);
    }
}

void drain_pending() {
    State& s = state();
    std::deque<Entry> batch;

    for (;;) {
        {
            std::unique_lock<std::mutex> lock(s.queue_mutex);
            s.queue_cv.wait(lock, [&s] { return s.stopping || !s.pending.empty(); });
            if (s.pending.empty()) {
                return;
            }
            batch.swap(s.pending);
        }

        for (const auto& entry : batch) {
            emit(entry);
        }
        batch.clear();
    }
}

} // namespace

void Logger::initialize(const std::string& name, const Config& config) {
    // A second initialize replaces the file and writer thread of the first
    shutdown();

    State& s = state();
    {
        std::lock_guard<std::mutex> lock(s.write_mutex);
        s.name = name;
        s.config = config;

        if (config.enable_file_output) {
            s.file.clear();
            s.file.open(config.log_file_path, std::ios::app);
            if (!s.file.is_open()) {
                std::cerr << "Failed to open log file: " << config.log_file_path << std::endl;
            }
        }
    }

    level_.store(config.level);

    if (config.enable_async_logging) {
        std::lock_guard<std::mutex> lock(s.queue_mutex);
        s.stopping = false;
        s.pending_limit = config.async_buffer_size;
        s.writer = std::thread(drain_pending);
    }
}

void Logger::shutdown() {
    State& s = state();

    std::thread writer;
    {
        std::lock_guard<std::mutex> lock(s.queue_mutex);
        s.stopping = true;
        writer = std::move(s.writer);
    }
    s.queue_cv.notify_all();
    if (writer.joinable()) {
        writer.join();
    }

    std::lock_guard<std::mutex> lock(s.write_mutex);
    if (s.file.is_open()) {
        s.file.flush();
        s.file.close();
    }
}

void Logger::set_format(OutputFormat format) {
    State& s = state();
    std::lock_guard<std::mutex> lock(s.write_mutex);
    s.config.format = format;
}

void Logger::set_sink(LogSink sink) {
    State& s = state();
    std::lock_guard<std::mutex> lock(s.write_mutex);
    s.sink = std::move(sink);
}

void Logger::log_structured(LogLevel level, const std::string& message, const LogContext& context) {
    if (!enabled(level)) return;
    dispatch(level, message, context);
}

void Logger::log_error(const std::string& message, const std::exception& e, const LogContext& context) {
    LogContext with_exception = context;
    with_exception.add("exception_type", typeid(e).name());
    with_exception.add("exception_message", e.what());
    dispatch(LogLevel::ERROR, message, with_exception);
}

void Logger::dispatch(LogLevel level, const std::string& message, const LogContext& context) {
    Entry entry{level, message, context, std::chrono::system_clock::now(), std::this_thread::get_id()};

    State& s = state();
    if (!inside_sink) {
        std::lock_guard<std::mutex> lock(s.queue_mutex);
        if (s.writer.joinable() && !s.stopping) {
            // Oldest entries are dropped once the queue is full
            if (s.pending.size() >= s.pending_limit && !s.pending.empty()) {
                s.pending.pop_front();
            }
            s.pending.push_back(std::move(entry));
            s.queue_cv.notify_one();
            return;
        }
    }

    emit(entry);
}

} // namespace common
} // namespace xcore
