/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace swarmcron {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // One JSON object per line instead of the bracketed text format
    static void setJson(bool enabled) noexcept;
    [[nodiscard]] static bool json() noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& value) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
void clearThreadName() noexcept;
// Name of the calling thread, "T<id>" when it has none
[[nodiscard]] std::string threadName();

// Names a short-lived thread; the name is dropped when the scope ends.
class ScopedThreadName {
public:
    explicit ScopedThreadName(const std::string& name) { setThreadName(name); }
    ~ScopedThreadName() { clearThreadName(); }

    ScopedThreadName(const ScopedThreadName&) = delete;
    ScopedThreadName& operator=(const ScopedThreadName&) = delete;
};

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::swarmcron::Logger::error(msg)
#define LOG_WARN(msg)  ::swarmcron::Logger::warn(msg)  
#define LOG_INFO(msg)  ::swarmcron::Logger::info(msg)
#define LOG_DEBUG(msg) ::swarmcron::Logger::debug(msg)
#define LOG_TRACE(msg) ::swarmcron::Logger::trace(msg)
