/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "swarmcron/duration.hpp"
#include "swarmcron/labels.hpp"
#include "swarmcron/registry.hpp"
#include "swarmcron/waiter.hpp"

namespace swarmcron {

struct TriggerResult {
    bool ok = false;
    int status = 500;
    std::string body;
    explicit operator bool() const noexcept { return ok; }
};

// Handles an external run request: check the key, fire the job right away
// and wait for the new task to finish.
class TriggerService final {
public:
    TriggerService(ScheduleRegistry& registry, CompletionWaiter& waiter, Duration defaultTimeout) noexcept;

    TriggerService(const TriggerService&) = delete;
    TriggerService& operator=(const TriggerService&) = delete;

    [[nodiscard]] TriggerResult handle(const std::string& service, const std::string& key,
                                       const CancelToken* cancel = nullptr);

    // Job timeout label, or the default when absent or unparsable; never above the default.
    [[nodiscard]] Duration timeoutFor(const JobSpec& spec) const;

    [[nodiscard]] Duration defaultTimeout() const noexcept { return defaultTimeout_; }

private:
    ScheduleRegistry& registry_;
    CompletionWaiter& waiter_;
    Duration defaultTimeout_;
};

}
