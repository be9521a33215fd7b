#pragma once
#include <atomic>
#include <iostream>
#include <string>
#include <mutex>

namespace agentic::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the library and the tools share one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Optional tag printed with every line, e.g. the file being inspected
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        // Messages below this level are dropped. Library default is WARN.
        void set_min_level(LogLevel level) {
            min_level_.store(level, std::memory_order_relaxed);
        }

        bool enabled(LogLevel level) const {
            return level >= min_level_.load(std::memory_order_relaxed);
        }

        void log(LogLevel level, const std::string& message) {
            if (!enabled(level)) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);

            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << "[" << level_to_string(level) << "] "
                << (context_.empty() ? "" : "[" + context_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        std::atomic<LogLevel> min_level_{LogLevel::WARN};

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

    // 3. Helper macros. The message expression is only built when the level is enabled.
    #define AGENTIC_LOG_AT(level, msg)                                                   \
        do {                                                                             \
            auto& agentic_logger_ = agentic::core::logging::Logger::get();               \
            if (agentic_logger_.enabled(level)) {                                        \
                agentic_logger_.log(level, msg);                                         \
            }                                                                            \
        } while (0)

    #define LOG_DEBUG(msg) AGENTIC_LOG_AT(agentic::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  AGENTIC_LOG_AT(agentic::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  AGENTIC_LOG_AT(agentic::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) AGENTIC_LOG_AT(agentic::core::logging::LogLevel::ERROR, msg)

} // namespace agentic::core::logging
