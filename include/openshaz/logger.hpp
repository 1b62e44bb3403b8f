/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace openshaz {

enum class LogLevel : uint8_t {
    CRITICAL = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void critical(const std::string& msg) noexcept { log(LogLevel::CRITICAL, msg); }
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);

}

// Convenience macros for common usage
#define LOG_CRITICAL(msg) ::openshaz::Logger::critical(msg)
#define LOG_ERROR(msg) ::openshaz::Logger::error(msg)
#define LOG_WARN(msg)  ::openshaz::Logger::warn(msg)
#define LOG_INFO(msg)  ::openshaz::Logger::info(msg)
#define LOG_DEBUG(msg) ::openshaz::Logger::debug(msg)
#define LOG_TRACE(msg) ::openshaz::Logger::trace(msg)
