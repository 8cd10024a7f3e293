#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace trustgate::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide sink. Messages must already be redacted.
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

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << "[" << level_to_string(level) << "] "
                << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& level) {
            if (text == "debug") { level = LogLevel::DEBUG; return true; }
            if (text == "info")  { level = LogLevel::INFO;  return true; }
            if (text == "warn")  { level = LogLevel::WARN;  return true; }
            if (text == "error") { level = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

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

    #define LOG_DEBUG(msg) trustgate::core::logging::Logger::get().log(trustgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  trustgate::core::logging::Logger::get().log(trustgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  trustgate::core::logging::Logger::get().log(trustgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) trustgate::core::logging::Logger::get().log(trustgate::core::logging::LogLevel::ERROR, msg)

} // namespace trustgate::core::logging
