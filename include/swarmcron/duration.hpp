/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace swarmcron {

using Duration = std::chrono::nanoseconds;

// Parses duration strings such as "300ms", "1.5h" or "2h45m".
// Valid units are "ns", "us" (or "µs"), "ms", "s", "m", "h".
[[nodiscard]] std::optional<Duration> parseDuration(const std::string& text) noexcept;

// Inverse of parseDuration for log output, e.g. "1h30m0s".
[[nodiscard]] std::string formatDuration(Duration d);

}
