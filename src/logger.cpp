/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/logger.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace swarmcron {

static LogLevel g_level = LogLevel::INFO;
static bool g_json = false;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;

// Caller holds g_log_mutex
static std::string threadNameLocked() {
    auto tid = std::this_thread::get_id();
    auto it = g_thread_names.find(tid);
    if (it != g_thread_names.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::setJson(bool enabled) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_json = enabled;
}

bool Logger::json() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_json;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return; // Skip if below threshold
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::string thread_info;
        bool asJson = false;
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            asJson = g_json;
            thread_info = threadNameLocked();
        }

        std::tm tm{};
        localtime_r(&time_t, &tm);

        std::stringstream ss;
        if (asJson) {
            std::stringstream ts;
            ts << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
            ts << "." << std::setfill('0') << std::setw(3) << ms.count();
            ts << std::put_time(&tm, "%z");

            std::string levelName = levelToString(level);
            while (!levelName.empty() && levelName.back() == ' ') levelName.pop_back();
            for (char& c : levelName) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }

            nlohmann::json line = {
                {"time", ts.str()},
                {"level", levelName},
                {"thread", thread_info},
                {"message", message}
            };
            ss << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        } else {
            ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
            ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
            ss << " [" << levelToString(level) << "]";
            ss << " [" << thread_info << "]";
            ss << " " << message;
        }

        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << ss.str() << std::endl;
        }
    } catch (const std::exception&) {
        // Never throw from logging - would cause infinite loops
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& value) noexcept {
    std::string level_str(value);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error" || level_str == "fatal" || level_str == "panic") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("SWARMCRON_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;

    return parseLevel(env_val).value_or(LogLevel::INFO);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

void clearThreadName() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names.erase(std::this_thread::get_id());
}

std::string threadName() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return threadNameLocked();
}

}
