#ifndef TASKLIST_LOGGER_H
#define TASKLIST_LOGGER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tasklist {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide asynchronous logger.
 *
 * Callers append to a pending batch; a writer thread swaps the batch out and
 * formats it, so request handlers never block on log I/O. Lines carry the
 * time they were logged, not the time they were written.
 */
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // "stdout" (or empty), a file path, or "/dev/null" to disable output
    void configure(const std::string& target);

    void set_level(LogLevel level) { threshold_ = level; }

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
    void info(std::string_view message) { log(LogLevel::INFO, message); }
    void warn(std::string_view message) { log(LogLevel::WARN, message); }
    void error(std::string_view message) { log(LogLevel::ERROR, message); }

    // "ACCESS: <ip> <method> <path> <status> <ms>ms" at INFO
    void log_access(std::string_view client_ip,
                    std::string_view method,
                    std::string_view path,
                    int status_code,
                    long long response_time_ms);

    // Blocks until the writer has caught up with everything logged.
    void flush();

private:
    enum class Sink { Console, File, Discard };

    struct Entry {
        std::chrono::system_clock::time_point at;
        LogLevel level;
        std::string text;  // already prefixed
    };

    Logger();
    ~Logger();

    bool accepts(LogLevel level) const;
    void push(LogLevel level, std::string text);
    void writer_loop();
    void write(const Entry& entry);

    std::atomic<Sink> sink_{Sink::Console};
    std::atomic<LogLevel> threshold_{LogLevel::INFO};
    std::ofstream file_;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::vector<Entry> pending_;
    std::uint64_t pushed_ = 0;
    std::uint64_t written_ = 0;
    bool stopping_ = false;
    std::thread writer_;
};

/** @brief Parses "debug", "info", "warn" or "error" (case-insensitive). */
LogLevel parse_log_level(std::string_view name);

} // namespace tasklist

#endif // TASKLIST_LOGGER_H
