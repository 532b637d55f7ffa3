#pragma once
#include <iostream>
#include <string>
#include <mutex>
#include <utility>

namespace agentrun::core::logging {

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
        // Singleton access so the whole app shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // The run tag is per thread: parallel runs never see each other's id.
        static void set_run_id(const std::string& id) {
            current_run_id() = id;
        }

        static const std::string& run_id() {
            return current_run_id();
        }

        void log(LogLevel level, const std::string& message) {
            const std::string& tag = current_run_id();
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (tag.empty() ? "" : "[" + tag + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string& current_run_id() {
            thread_local std::string id;
            return id;
        }

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // Tags every line logged by this thread until the scope ends.
    class ScopedRunTag {
    public:
        explicit ScopedRunTag(const std::string& run_id)
            : previous_(Logger::run_id()) {
            Logger::set_run_id(run_id);
        }
        ~ScopedRunTag() { Logger::set_run_id(previous_); }

        ScopedRunTag(const ScopedRunTag&) = delete;
        ScopedRunTag& operator=(const ScopedRunTag&) = delete;

    private:
        std::string previous_;
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define AGENTRUN_LOG_DEBUG(msg) ::agentrun::core::logging::Logger::get().log(::agentrun::core::logging::LogLevel::DEBUG, msg)
    #define AGENTRUN_LOG_INFO(msg)  ::agentrun::core::logging::Logger::get().log(::agentrun::core::logging::LogLevel::INFO, msg)
    #define AGENTRUN_LOG_WARN(msg)  ::agentrun::core::logging::Logger::get().log(::agentrun::core::logging::LogLevel::WARN, msg)
    #define AGENTRUN_LOG_ERROR(msg) ::agentrun::core::logging::Logger::get().log(::agentrun::core::logging::LogLevel::ERROR, msg)

} // namespace agentrun::core::logging
