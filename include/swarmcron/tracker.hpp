/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <thread>

#include "swarmcron/duration.hpp"
#include "swarmcron/types.hpp"
#include "swarmcron/waiter.hpp"

namespace swarmcron {

// Follows scheduled runs in the background and logs how each one ended.
// All pending runs share one polling thread.
class RunTracker final {
public:
    RunTracker(CompletionWaiter& waiter, Duration timeout) noexcept;
    ~RunTracker();

    RunTracker(const RunTracker&) = delete;
    RunTracker& operator=(const RunTracker&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;

    using DoneCallback = std::function<void(const RunOutcome&)>;

    // `onDone` runs on the tracker thread once the outcome is known.
    void track(const std::string& service, TaskSnapshot baseline, DoneCallback onDone = nullptr);
    [[nodiscard]] std::size_t pending() const;

private:
    struct PendingRun {
        std::string service;
        TaskSnapshot baseline;
        std::chrono::steady_clock::time_point started;
        std::chrono::steady_clock::time_point deadline;
        DoneCallback onDone;
    };

    void loop();
    void report(const PendingRun& run, const RunOutcome& outcome) const;

    CompletionWaiter& waiter_;
    Duration timeout_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::list<PendingRun> pending_;
    std::size_t polling_ = 0;  // runs taken out of pending_ by the current round

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread thread_;
};

}
