/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <bitset>
#include <chrono>
#include <optional>
#include <string>

#include "swarmcron/duration.hpp"

namespace swarmcron {

using Clock = std::chrono::system_clock;

struct CronParseResult;

// Calendar schedule in local time. Accepts 5 fields (minute precision),
// 6 fields (leading seconds) or one of the @ descriptors, including
// "@every <duration>". A TZ= or CRON_TZ= prefix may select UTC.
class CronSchedule {
public:
    CronSchedule() = default;

    [[nodiscard]] static CronParseResult parse(const std::string& expression);

    // First activation strictly after `after`, or nullopt when the
    // expression can never match (e.g. "0 0 30 2 *").
    [[nodiscard]] std::optional<Clock::time_point> next(Clock::time_point after) const;

    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }
    [[nodiscard]] bool isInterval() const noexcept { return every_.has_value(); }
    [[nodiscard]] bool utc() const noexcept { return utc_; }

private:
    [[nodiscard]] bool dayMatches(int mday, int wday) const noexcept;

    std::string expression_;
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;
    std::bitset<13> months_;
    std::bitset<7> daysOfWeek_;
    bool domStar_ = false;
    bool dowStar_ = false;
    bool utc_ = false;
    std::optional<Duration> every_;

    friend struct CronFieldParser;
};

struct CronParseResult {
    bool ok = false;
    CronSchedule schedule;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

}
