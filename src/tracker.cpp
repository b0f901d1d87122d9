/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/tracker.hpp"
#include "swarmcron/logger.hpp"

namespace swarmcron {

RunTracker::RunTracker(CompletionWaiter& waiter, Duration timeout) noexcept
    : waiter_(waiter), timeout_(timeout) {
}

RunTracker::~RunTracker() {
    stop();
}

bool RunTracker::start() {
    if (running_.load()) {
        return false;
    }
    shutdown_.store(false);
    running_.store(true);
    try {
        thread_ = std::thread(&RunTracker::loop, this);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start run tracker: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void RunTracker::stop() noexcept {
    if (!running_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.empty()) {
        LOG_INFO("Run tracker stopped with " + std::to_string(pending_.size()) + " run(s) still pending");
        pending_.clear();
    }
}

void RunTracker::track(const std::string& service, TaskSnapshot baseline, DoneCallback onDone) {
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back({service, std::move(baseline), now,
                            now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout_),
                            std::move(onDone)});
    }
    wake_.notify_all();
}

std::size_t RunTracker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size() + polling_;
}

void RunTracker::loop() {
    setThreadName("Tracker");

    while (!shutdown_.load()) {
        std::list<PendingRun> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return shutdown_.load() || !pending_.empty(); });
            if (shutdown_.load()) {
                break;
            }
            batch.splice(batch.end(), pending_);
            polling_ = batch.size();
        }

        // Poll without holding the lock so track() never blocks on the orchestrator
        auto now = std::chrono::steady_clock::now();
        for (auto it = batch.begin(); it != batch.end();) {
            std::optional<RunOutcome> outcome;
            try {
                outcome = waiter_.poll(it->service, it->baseline);
            } catch (const OrchestratorError& e) {
                LOG_WARN("Cannot list tasks of " + it->service + ": " + std::string(e.what()));
            }

            if (!outcome && now >= it->deadline) {
                outcome = RunOutcome::timedOut();
            }
            if (outcome) {
                report(*it, *outcome);
                if (it->onDone) {
                    it->onDone(*outcome);
                }
                it = batch.erase(it);
            } else {
                ++it;
            }
        }

        std::unique_lock<std::mutex> lock(mutex_);
        pending_.splice(pending_.begin(), batch);
        polling_ = 0;
        if (!pending_.empty()) {
            wake_.wait_for(lock, waiter_.pollInterval(), [this] { return shutdown_.load(); });
        }
    }
}

void RunTracker::report(const PendingRun& run, const RunOutcome& outcome) const {
    auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - run.started);
    switch (outcome.kind) {
        case RunOutcome::Kind::Completed:
            LOG_INFO("Job " + run.service + " completed in " + formatDuration(elapsed) +
                     " (task " + outcome.taskId + ", " + std::to_string(outcome.logs.size()) + " bytes of logs)");
            break;
        case RunOutcome::Kind::Failed:
            LOG_ERROR("Job " + run.service + " failed: " + outcome.reason + " (task " + outcome.taskId + ")");
            break;
        default:
            LOG_WARN("Job " + run.service + " " + toString(outcome.kind) + " after " + formatDuration(elapsed));
            break;
    }
}

}
