#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace hive::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Lines go to stderr so stdout stays free for the
    // approval prompt:  12:04:05.120 [INFO ] [run-3f2a] Scheduler: task ...
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Run id printed on every line; empty disables the prefix.
        void set_context_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // Tests point this at a stringstream; the stream must outlive its use.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            write_timestamp();
            *out_ << " [" << tag(level) << "] ";
            if (!context_id_.empty()) {
                *out_ << "[" << context_id_ << "] ";
            }
            *out_ << message << '\n';
            out_->flush();
        }

        static std::optional<LogLevel> parse_level(const std::string& text) {
            if (text == "debug") return LogLevel::DEBUG;
            if (text == "info") return LogLevel::INFO;
            if (text == "warn") return LogLevel::WARN;
            if (text == "error") return LogLevel::ERROR;
            return std::nullopt;
        }

    private:
        Logger() = default;

        static const char* tag(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
            }
            return "?????";
        }

        void write_timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()).count() % 1000;
            std::tm local{};
            localtime_r(&seconds, &local);
            *out_ << std::put_time(&local, "%H:%M:%S") << '.'
                  << std::setw(3) << std::setfill('0') << millis << std::setfill(' ');
        }

        std::mutex mutex_;
        std::ostream* out_ = &std::cerr;
        std::string context_id_;
        LogLevel min_level_ = LogLevel::INFO;
    };

    #define LOG_DEBUG(msg) hive::core::logging::Logger::get().log(hive::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  hive::core::logging::Logger::get().log(hive::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  hive::core::logging::Logger::get().log(hive::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) hive::core::logging::Logger::get().log(hive::core::logging::LogLevel::ERROR, msg)

} // namespace hive::core::logging
