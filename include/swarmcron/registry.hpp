/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "swarmcron/labels.hpp"
#include "swarmcron/orchestrator.hpp"
#include "swarmcron/runner.hpp"
#include "swarmcron/scheduler.hpp"

namespace swarmcron {

class RunTracker;

struct ScheduledJob {
    EntryId entry = 0;
    std::shared_ptr<JobRunner> runner;
};

// Service name -> live schedule entry. A name is present only while the
// service has an enabled job with a valid schedule.
class ScheduleRegistry final {
public:
    ScheduleRegistry(Scheduler& scheduler, Orchestrator& orchestrator, RunTracker* tracker = nullptr) noexcept;

    ScheduleRegistry(const ScheduleRegistry&) = delete;
    ScheduleRegistry& operator=(const ScheduleRegistry&) = delete;

    [[nodiscard]] std::optional<ScheduledJob> find(const std::string& service) const;

    // Fails when the name is already registered or the schedule is invalid.
    [[nodiscard]] AddResult add(const JobSpec& spec);
    // Removes the current entry (if any) then registers `spec`. The new
    // runner keeps the run state of the one it replaces.
    [[nodiscard]] AddResult replace(const JobSpec& spec);
    bool remove(const std::string& service) noexcept;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    [[nodiscard]] AddResult addLocked(const JobSpec& spec);
    bool removeLocked(const std::string& service) noexcept;
    [[nodiscard]] std::shared_ptr<RunState> stateLocked(const std::string& service);

    Scheduler& scheduler_;
    Orchestrator& orchestrator_;
    RunTracker* tracker_;

    mutable std::mutex mutex_;
    std::map<std::string, ScheduledJob> jobs_;
    // Alive while a runner of the service exists, registered or in flight
    std::map<std::string, std::weak_ptr<RunState>> states_;
};

}
