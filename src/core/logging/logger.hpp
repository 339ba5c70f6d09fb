#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace scriptgate::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info")  return LogLevel::INFO;
        if (text == "warn")  return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Process-wide logger. Writes to stderr so that stdout carries only
    // the machine-readable execution result. Request-scoped messages carry
    // their run id in the text.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] " << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) scriptgate::core::logging::Logger::get().log(scriptgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  scriptgate::core::logging::Logger::get().log(scriptgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  scriptgate::core::logging::Logger::get().log(scriptgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) scriptgate::core::logging::Logger::get().log(scriptgate::core::logging::LogLevel::ERROR, msg)

} // namespace scriptgate::core::logging
