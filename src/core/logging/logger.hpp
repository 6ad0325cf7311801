#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace prompt_guard::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger. Writes to stderr: stdout belongs to the hook response.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_invocation_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            invocation_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (invocation_id_.empty() ? "" : "[" + invocation_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string invocation_id_;
        LogLevel min_level_ = LogLevel::WARN;

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

    // 3. Helper macros
    #define LOG_DEBUG(msg) prompt_guard::core::logging::Logger::get().log(prompt_guard::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  prompt_guard::core::logging::Logger::get().log(prompt_guard::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  prompt_guard::core::logging::Logger::get().log(prompt_guard::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) prompt_guard::core::logging::Logger::get().log(prompt_guard::core::logging::LogLevel::ERROR, msg)

} // namespace prompt_guard::core::logging
