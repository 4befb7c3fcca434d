#pragma once
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace memvault::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup. Writes to stderr by default so stdout stays
    // reserved for tool results.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_sink(std::ostream& sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &sink;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *sink_ << timestamp() << " - " << level_to_string(level) << " - "
                   << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cerr;

        static std::string timestamp() {
            const std::time_t now = std::time(nullptr);
            std::tm local{};
            localtime_r(&now, &local);
            char buffer[32];
            const std::size_t n =
                std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
            return std::string(buffer, n);
        }

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define MEMVAULT_LOG_DEBUG(msg) memvault::core::logging::Logger::get().log(memvault::core::logging::LogLevel::DEBUG, msg)
    #define MEMVAULT_LOG_INFO(msg)  memvault::core::logging::Logger::get().log(memvault::core::logging::LogLevel::INFO, msg)
    #define MEMVAULT_LOG_WARN(msg)  memvault::core::logging::Logger::get().log(memvault::core::logging::LogLevel::WARN, msg)
    #define MEMVAULT_LOG_ERROR(msg) memvault::core::logging::Logger::get().log(memvault::core::logging::LogLevel::ERROR, msg)

} // namespace memvault::core::logging
