/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "swarmcron/duration.hpp"
#include "swarmcron/orchestrator.hpp"
#include "swarmcron/types.hpp"

namespace swarmcron {

struct RunOutcome {
    enum class Kind : std::uint8_t { Completed, Failed, TimedOut, Cancelled };

    Kind kind = Kind::TimedOut;
    std::string taskId;
    std::string logs;
    std::string reason;

    [[nodiscard]] bool ok() const noexcept { return kind == Kind::Completed; }

    static RunOutcome completed(std::string taskId, std::string logs);
    static RunOutcome failed(std::string taskId, std::string reason);
    static RunOutcome timedOut();
    static RunOutcome cancelled();
};

[[nodiscard]] const char* toString(RunOutcome::Kind kind) noexcept;

// Cooperative cancellation shared between a waiting thread and whoever
// may abort the wait (shutdown, a dropped request).
class CancelToken {
public:
    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

    // Sleeps for up to `duration`; returns true as soon as cancel() is called.
    bool sleepFor(std::chrono::steady_clock::duration duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
};

class CompletionWaiter final {
public:
    explicit CompletionWaiter(Orchestrator& orchestrator,
                              std::chrono::milliseconds pollInterval = std::chrono::milliseconds(500)) noexcept;

    // Polls the tasks of `service` until one that is not part of `baseline`
    // completes or fails, the timeout elapses, or `cancel` fires.
    [[nodiscard]] RunOutcome wait(const std::string& service, const TaskSnapshot& baseline,
                                  Duration timeout, const CancelToken* cancel = nullptr);

    // One poll step: an outcome when a new task reached a terminal state.
    // Throws OrchestratorError when the task list cannot be read.
    [[nodiscard]] std::optional<RunOutcome> poll(const std::string& service, const TaskSnapshot& baseline);

    [[nodiscard]] std::chrono::milliseconds pollInterval() const noexcept { return pollInterval_; }

private:
    [[nodiscard]] std::string fetchLogs(const std::string& service, const std::string& taskId);

    Orchestrator& orchestrator_;
    std::chrono::milliseconds pollInterval_;
};

}
