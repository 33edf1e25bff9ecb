/**
 * @file logger.hpp
 * @brief Logging utilities for flagsync.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 */
#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <chrono>
#include <iostream>
#include <optional>
#include <algorithm>
#include <cctype>

namespace flagsync {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger. Off suppresses every message.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

    /**
     * @brief Parse a log level name (case insensitive).
     * @param name One of TRACE, DEBUG, INFO, WARN, ERROR, OFF
     * @return Parsed level, std::nullopt for unknown names
     */
    inline std::optional<LogLevel> parseLogLevel(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (name == "TRACE") return LogLevel::Trace;
        if (name == "DEBUG") return LogLevel::Debug;
        if (name == "INFO")  return LogLevel::Info;
        if (name == "WARN" || name == "WARNING") return LogLevel::Warn;
        if (name == "ERROR") return LogLevel::Error;
        if (name == "OFF")   return LogLevel::Off;
        return std::nullopt;
    }

    /**
     * @class Logger
     * @brief Singleton logger class for flagsync.
     *
     * Provides thread-safe logging with customizable log sinks and log levels.
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
         * @brief Set a custom log sink function. An empty sink restores stdout.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = s ? std::move(s) : defaultSink();
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            std::scoped_lock lk(m_);
            if (lvl == LogLevel::Off || lvl < level_) return;
            sink_(lvl, msg);
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            /* default sink → stdout */
            return [](LogLevel l, const std::string& m) {
                static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR","OFF" };
                std::cout << "[" << names[(int)l] << "] " << m << '\n';
            };
        }

        mutable std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

#define LOG_TRACE(msg) ::flagsync::Logger::inst().log(::flagsync::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::flagsync::Logger::inst().log(::flagsync::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::flagsync::Logger::inst().log(::flagsync::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::flagsync::Logger::inst().log(::flagsync::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::flagsync::Logger::inst().log(::flagsync::LogLevel::Error, msg)
}
