/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/waiter.hpp"
#include "swarmcron/logger.hpp"
#include <algorithm>
#include <thread>
#include <unordered_set>

namespace swarmcron {

RunOutcome RunOutcome::completed(std::string taskId, std::string logs) {
    RunOutcome o;
    o.kind = Kind::Completed;
    o.taskId = std::move(taskId);
    o.logs = std::move(logs);
    return o;
}

RunOutcome RunOutcome::failed(std::string taskId, std::string reason) {
    RunOutcome o;
    o.kind = Kind::Failed;
    o.taskId = std::move(taskId);
    o.reason = std::move(reason);
    return o;
}

RunOutcome RunOutcome::timedOut() {
    RunOutcome o;
    o.kind = Kind::TimedOut;
    o.reason = "Timeout";
    return o;
}

RunOutcome RunOutcome::cancelled() {
    RunOutcome o;
    o.kind = Kind::Cancelled;
    o.reason = "Cancelled";
    return o;
}

const char* toString(RunOutcome::Kind kind) noexcept {
    switch (kind) {
        case RunOutcome::Kind::Completed: return "completed";
        case RunOutcome::Kind::Failed: return "failed";
        case RunOutcome::Kind::TimedOut: return "timed out";
        case RunOutcome::Kind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

void CancelToken::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancelToken::sleepFor(std::chrono::steady_clock::duration duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

CompletionWaiter::CompletionWaiter(Orchestrator& orchestrator, std::chrono::milliseconds pollInterval) noexcept
    : orchestrator_(orchestrator),
      pollInterval_(pollInterval > std::chrono::milliseconds::zero() ? pollInterval : std::chrono::milliseconds(500)) {
}

RunOutcome CompletionWaiter::wait(const std::string& service, const TaskSnapshot& baseline,
                                  Duration timeout, const CancelToken* cancel) {
    using SteadyClock = std::chrono::steady_clock;
    const auto deadline = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(timeout);

    LOG_DEBUG("Waiting up to " + formatDuration(timeout) + " for a new task of " + service +
              " (" + std::to_string(baseline.size()) + " known)");

    while (true) {
        if (cancel && cancel->cancelled()) {
            LOG_INFO("Wait for " + service + " cancelled");
            return RunOutcome::cancelled();
        }
        if (SteadyClock::now() >= deadline) {
            LOG_ERROR("Timeout waiting for " + service + " after " + formatDuration(timeout));
            return RunOutcome::timedOut();
        }

        try {
            if (auto outcome = poll(service, baseline)) {
                return *outcome;
            }
        } catch (const OrchestratorError& e) {
            LOG_WARN("Cannot list tasks of " + service + ": " + std::string(e.what()));
        }

        auto remaining = deadline - SteadyClock::now();
        if (remaining <= SteadyClock::duration::zero()) {
            continue;
        }
        auto pause = std::min<SteadyClock::duration>(pollInterval_, remaining);
        if (cancel) {
            (void)cancel->sleepFor(pause);
        } else {
            std::this_thread::sleep_for(pause);
        }
    }
}

std::optional<RunOutcome> CompletionWaiter::poll(const std::string& service, const TaskSnapshot& baseline) {
    std::unordered_set<std::string> known;
    known.reserve(baseline.size());
    for (const auto& task : baseline) {
        known.insert(task.id);
    }

    auto tasks = orchestrator_.listTasks(service);
    for (const auto& task : tasks) {
        if (known.count(task.id) > 0) {
            continue;
        }

        switch (task.state) {
            case TaskState::Complete: {
                LOG_INFO("Task " + task.id + " of " + service + " completed");
                return RunOutcome::completed(task.id, fetchLogs(service, task.id));
            }
            case TaskState::Failed:
            case TaskState::Rejected: {
                std::string reason = !task.error.empty() ? task.error : task.message;
                if (reason.empty()) {
                    reason = std::string("task ") + toString(task.state);
                }
                LOG_WARN("Task " + task.id + " of " + service + " " + toString(task.state) + ": " + reason);
                return RunOutcome::failed(task.id, reason);
            }
            default:
                LOG_TRACE("Task " + task.id + " of " + service + " is " + toString(task.state));
                break;
        }
    }

    return std::nullopt;
}

std::string CompletionWaiter::fetchLogs(const std::string& service, const std::string& taskId) {
    try {
        return orchestrator_.taskLogs(taskId);
    } catch (const OrchestratorError& e) {
        LOG_ERROR("Cannot get logs for " + taskId + " of " + service + ": " + std::string(e.what()));
        return "";
    }
}

}
