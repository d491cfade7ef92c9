#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace helm::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_correlation_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            correlation_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // Answers go to stdout, so diagnostics stay on stderr.
        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (correlation_id_.empty() ? "" : "[" + correlation_id_ + "] ")
                      << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& out) {
            if (text == "debug") { out = LogLevel::DEBUG; return true; }
            if (text == "info") { out = LogLevel::INFO; return true; }
            if (text == "warn") { out = LogLevel::WARN; return true; }
            if (text == "error") { out = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string correlation_id_;
        LogLevel min_level_ = LogLevel::WARN;

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

    #define HELM_LOG_DEBUG(msg) helm::core::logging::Logger::get().log(helm::core::logging::LogLevel::DEBUG, msg)
    #define HELM_LOG_INFO(msg)  helm::core::logging::Logger::get().log(helm::core::logging::LogLevel::INFO, msg)
    #define HELM_LOG_WARN(msg)  helm::core::logging::Logger::get().log(helm::core::logging::LogLevel::WARN, msg)
    #define HELM_LOG_ERROR(msg) helm::core::logging::Logger::get().log(helm::core::logging::LogLevel::ERROR, msg)

} // namespace helm::core::logging
