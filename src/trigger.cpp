/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/trigger.hpp"
#include "swarmcron/logger.hpp"
#include <algorithm>

namespace swarmcron {

namespace {

TriggerResult failure(std::string body) {
    TriggerResult result;
    result.ok = false;
    result.status = 500;
    result.body = std::move(body);
    return result;
}

}

TriggerService::TriggerService(ScheduleRegistry& registry, CompletionWaiter& waiter, Duration defaultTimeout) noexcept
    : registry_(registry), waiter_(waiter), defaultTimeout_(defaultTimeout) {
}

TriggerResult TriggerService::handle(const std::string& service, const std::string& key, const CancelToken* cancel) {
    auto job = registry_.find(service);
    if (!job) {
        LOG_INFO("Event for unknown service '" + service + "'");
        return failure("service " + service + " not found");
    }

    JobRunner& runner = *job->runner;
    const JobSpec& spec = runner.spec();

    if (!spec.eventEnabled || spec.eventKey != key) {
        LOG_INFO("Rejected event for service '" + service + "'");
        return failure("event run rejected for service " + service);
    }

    if (!runner.beginEventRun()) {
        LOG_INFO("Event run of '" + service + "' already in progress");
        return failure("event run already in progress for service " + service);
    }
    EventRunGuard guard(runner);

    RunStart start = runner.run(RunOrigin::Event);
    if (start.status == RunStatus::Skipped) {
        return failure("job " + service + " is still running");
    }
    if (!start) {
        LOG_ERROR("Event run of " + service + " failed: " + start.error);
        return failure(start.error);
    }

    Duration timeout = timeoutFor(spec);
    LOG_INFO("Event run of " + service + " started, timeout " + formatDuration(timeout));

    RunOutcome outcome = waiter_.wait(service, start.baseline, timeout, cancel);
    runner.finish(outcome, start.generation);
    if (outcome.ok()) {
        TriggerResult result;
        result.ok = true;
        result.status = 200;
        result.body = std::move(outcome.logs);
        return result;
    }
    return failure(outcome.reason);
}

Duration TriggerService::timeoutFor(const JobSpec& spec) const {
    if (spec.eventTimeout.empty()) {
        return defaultTimeout_;
    }
    auto parsed = parseDuration(spec.eventTimeout);
    if (!parsed || *parsed <= Duration::zero()) {
        LOG_WARN("Invalid event timeout '" + spec.eventTimeout + "' for " + spec.name + ", using " +
                 formatDuration(defaultTimeout_));
        return defaultTimeout_;
    }
    return std::min(*parsed, defaultTimeout_);
}

}
