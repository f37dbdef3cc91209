#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace compgym::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Lines are tagged with the active episode id, if any.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_episode_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            episode_id_ = id;
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
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cout << "[" << level_to_string(level) << "] "
                      << (episode_id_.empty() ? "" : "[" + episode_id_ + "] ")
                      << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& out) {
            if (text == "debug") { out = LogLevel::DEBUG; return true; }
            if (text == "info")  { out = LogLevel::INFO;  return true; }
            if (text == "warn")  { out = LogLevel::WARN;  return true; }
            if (text == "error") { out = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string episode_id_;
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

    #define LOG_DEBUG(msg) compgym::core::logging::Logger::get().log(compgym::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  compgym::core::logging::Logger::get().log(compgym::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  compgym::core::logging::Logger::get().log(compgym::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) compgym::core::logging::Logger::get().log(compgym::core::logging::LogLevel::ERROR, msg)

} // namespace compgym::core::logging
