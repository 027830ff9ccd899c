#include <tasklist/logger.h>
#include <tasklist/exceptions.h>
#include <tasklist/util/string.h>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tasklist {

namespace {

    const char* level_name(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "ERROR";
        }
        return "INFO";
    }

    // Local wall-clock time, "YYYY-MM-DD HH:MM:SS"
    std::string local_time(std::chrono::system_clock::time_point at) {
        const std::time_t secs = std::chrono::system_clock::to_time_t(at);
        std::tm parts{};
        localtime_r(&secs, &parts);

        std::ostringstream out;
        out << std::put_time(&parts, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }

}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : writer_(&Logger::writer_loop, this) {}

Logger::~Logger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    writer_.join();
}

void Logger::configure(const std::string& target) {
    if (target == "/dev/null") {
        sink_ = Sink::Discard;
        return;
    }
    if (target.empty() || target == "stdout") {
        sink_ = Sink::Console;
        return;
    }

    const std::filesystem::path path(target);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ConfigError("Cannot create log directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    // Swap files only while the writer is idle; it cannot start a batch while we hold the lock
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return written_ >= pushed_; });
    sink_ = Sink::Discard;
    file_.close();
    file_.clear();
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_) {
        throw ConfigError("Cannot open log file: " + target);
    }
    sink_ = Sink::File;
}

bool Logger::accepts(LogLevel level) const {
    return sink_.load() != Sink::Discard && level >= threshold_.load();
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!accepts(level)) return;
    push(level, std::string(level_name(level)) + ": " + std::string(message));
}

void Logger::log_access(std::string_view client_ip,
                        std::string_view method,
                        std::string_view path,
                        int status_code,
                        long long response_time_ms) {
    if (!accepts(LogLevel::INFO)) return;

    std::ostringstream line;
    line << "ACCESS: " << client_ip << ' ' << method << ' ' << path << ' '
         << status_code << ' ' << response_time_ms << "ms";
    push(LogLevel::INFO, line.str());
}

void Logger::push(LogLevel level, std::string text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back({std::chrono::system_clock::now(), level, std::move(text)});
        ++pushed_;
    }
    wake_.notify_one();
}

void Logger::writer_loop() {
    std::vector<Entry> batch;
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        wake_.wait(lock, [this] { return !pending_.empty() || stopping_; });
        if (pending_.empty()) {
            return;  // stopping with nothing left
        }

        batch.swap(pending_);
        lock.unlock();
        for (const auto& entry : batch) {
            write(entry);
        }
        if (sink_.load() == Sink::Console) {
            std::cout.flush();
        }
        lock.lock();

        written_ += batch.size();
        batch.clear();
        idle_.notify_all();
    }
}

void Logger::write(const Entry& entry) {
    const std::string line = "[" + local_time(entry.at) + "] " + entry.text + "\n";

    switch (sink_.load()) {
        case Sink::Console:
            (entry.level == LogLevel::ERROR ? std::cerr : std::cout) << line;
            break;
        case Sink::File:
            file_ << line;
            if (entry.level == LogLevel::ERROR) {
                file_.flush();
            }
            break;
        case Sink::Discard:
            break;
    }
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return written_ >= pushed_; });
    if (file_.is_open()) {
        file_.flush();
    }
}

LogLevel parse_log_level(std::string_view name) {
    const std::string lowered = util::to_lower(name);
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    throw ConfigError("Unknown log level: " + std::string(name));
}

} // namespace tasklist
