/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "swarmcron/duration.hpp"
#include "swarmcron/logger.hpp"

namespace swarmcron {

struct Config {
    LogLevel logLevel = LogLevel::INFO;
    bool logJson = false;

    std::string eventAddress = "0.0.0.0";
    std::uint16_t eventPort = 8080;
    Duration eventTimeout = std::chrono::hours(1);

    std::chrono::milliseconds pollInterval{500};
    int workers = 8;

    std::string dockerHost = "unix:///var/run/docker.sock";
    std::string dockerApiVersion = "1.41";
};

struct ConfigResult {
    bool ok = false;
    Config config;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Environment first (LOG_LEVEL, LOG_JSON, EVENT_PORT, EVENT_TIMEOUT,
// POLL_INTERVAL, WORKERS, DOCKER_HOST, DOCKER_API_VERSION), then flags.
// Flags take `--name value` or `--name=value`.
[[nodiscard]] ConfigResult parseConfig(int argc, const char* const argv[]);

[[nodiscard]] std::string usage(const std::string& program);

}
