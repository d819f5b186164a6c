/**
 * @file logger.hpp
 * @brief Logging utilities for dingstream.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace dingstream {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error };

    /**
     * @brief Map a textual level ("trace", "DEBUG", "warn", ...) to a LogLevel.
     * @param name Level name, case-insensitive
     * @param fallback Level returned when the name is not recognised
     */
    inline LogLevel parseLogLevel(std::string_view name, LogLevel fallback = LogLevel::Info) {
        std::string s;
        for (char c : name) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        if (s == "trace") return LogLevel::Trace;
        if (s == "debug") return LogLevel::Debug;
        if (s == "info")  return LogLevel::Info;
        if (s == "warn" || s == "warning") return LogLevel::Warn;
        if (s == "error") return LogLevel::Error;
        return fallback;
    }

    /**
     * @class Logger
     * @brief Singleton logger class for dingstream.
     *
     * Thread-safe logging with a replaceable sink and a minimum level. The
     * connection supervisor, dispatcher, watchdog and topic consumers all log
     * from their own threads through this instance.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         * @return Reference to the Logger instance
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level.
         * @param lvl LogLevel to set
         */
        void setLevel(LogLevel lvl) {
            std::scoped_lock lk(m_);
            level_ = lvl;
        }

        LogLevel level() const {
            std::scoped_lock lk(m_);
            return level_;
        }

        /**
         * @brief Set a custom log sink function.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = std::move(s);
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            std::scoped_lock lk(m_);
            if (lvl < level_ || !sink_) return;
            sink_(lvl, msg);
        }

    private:
        Logger() {
            /* default sink → stdout, local wall-clock time */
            sink_ = [](LogLevel l, const std::string& m) {
                static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR" };
                auto now = std::chrono::system_clock::now();
                std::time_t t = std::chrono::system_clock::to_time_t(now);
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()).count() % 1000;
                std::tm tm{};
#ifdef _WIN32
                localtime_s(&tm, &t);
#else
                localtime_r(&t, &tm);
#endif
                std::cout << std::put_time(&tm, "%F %T") << '.'
                          << std::setw(3) << std::setfill('0') << ms << std::setfill(' ')
                          << " [" << names[(int)l] << "] " << m << '\n';
            };
        }
        mutable std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

#define LOG_TRACE(msg) ::dingstream::Logger::inst().log(::dingstream::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::dingstream::Logger::inst().log(::dingstream::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::dingstream::Logger::inst().log(::dingstream::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::dingstream::Logger::inst().log(::dingstream::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::dingstream::Logger::inst().log(::dingstream::LogLevel::Error, msg)
}
