/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/registry.hpp"
#include "swarmcron/logger.hpp"

namespace swarmcron {

ScheduleRegistry::ScheduleRegistry(Scheduler& scheduler, Orchestrator& orchestrator, RunTracker* tracker) noexcept
    : scheduler_(scheduler), orchestrator_(orchestrator), tracker_(tracker) {
}

std::optional<ScheduledJob> ScheduleRegistry::find(const std::string& service) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(service);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

AddResult ScheduleRegistry::add(const JobSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.count(spec.name) > 0) {
        AddResult result;
        result.error = "service " + spec.name + " is already scheduled";
        return result;
    }
    return addLocked(spec);
}

AddResult ScheduleRegistry::replace(const JobSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    (void)removeLocked(spec.name);
    return addLocked(spec);
}

bool ScheduleRegistry::remove(const std::string& service) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return removeLocked(service);
}

std::size_t ScheduleRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

std::vector<std::string> ScheduleRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(jobs_.size());
    for (const auto& [name, job] : jobs_) {
        out.push_back(name);
    }
    return out;
}

AddResult ScheduleRegistry::addLocked(const JobSpec& spec) {
    auto runner = std::make_shared<JobRunner>(std::make_shared<const JobSpec>(spec), orchestrator_, tracker_,
                                              stateLocked(spec.name));
    AddResult result = scheduler_.add(spec.schedule, runner);
    if (!result) {
        return result;
    }
    jobs_[spec.name] = ScheduledJob{result.id, std::move(runner)};
    LOG_DEBUG("Registered " + spec.name + " as entry " + std::to_string(result.id));
    return result;
}

bool ScheduleRegistry::removeLocked(const std::string& service) noexcept {
    auto it = jobs_.find(service);
    if (it == jobs_.end()) {
        return false;
    }
    (void)scheduler_.remove(it->second.entry);
    LOG_DEBUG("Unregistered " + service + " (entry " + std::to_string(it->second.entry) + ")");
    jobs_.erase(it);

    for (auto state = states_.begin(); state != states_.end();) {
        if (state->second.expired()) {
            state = states_.erase(state);
        } else {
            ++state;
        }
    }
    return true;
}

std::shared_ptr<RunState> ScheduleRegistry::stateLocked(const std::string& service) {
    std::shared_ptr<RunState> state = states_[service].lock();
    if (!state) {
        state = std::make_shared<RunState>();
        states_[service] = state;
    }
    return state;
}

}
