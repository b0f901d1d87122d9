/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "swarmcron/labels.hpp"
#include "swarmcron/orchestrator.hpp"
#include "swarmcron/scheduler.hpp"
#include "swarmcron/types.hpp"
#include "swarmcron/waiter.hpp"

namespace swarmcron {

class RunTracker;

enum class RunOrigin : std::uint8_t { Schedule, Event };

enum class RunStatus : std::uint8_t {
    Started,
    Skipped,   // skip-running policy, or a scheduled firing during an event run
    Failed
};

struct RunStart {
    RunStatus status = RunStatus::Failed;
    TaskSnapshot baseline;
    std::uint64_t generation = 0;
    std::string error;
    explicit operator bool() const noexcept { return status == RunStatus::Started; }
};

// Run state of one service. Every runner built for the service shares it,
// so the event slot and the run lock survive a runner being replaced.
struct RunState {
    std::mutex mutex;
    std::atomic<bool> eventActive{false};
    std::uint64_t generation = 0;  // guarded by mutex, bumped by each started run
};

[[nodiscard]] bool isLiveTask(const TaskInfo& task) noexcept;

// Runs one service's job against the orchestrator. Scheduled firings come
// in through trigger(); event runs bracket run() with beginEventRun() and
// endEventRun().
class JobRunner final : public Schedulable {
public:
    JobRunner(std::shared_ptr<const JobSpec> spec, Orchestrator& orchestrator, RunTracker* tracker = nullptr,
              std::shared_ptr<RunState> state = nullptr);

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    void trigger() override;
    [[nodiscard]] std::string name() const override { return spec_->name; }
    [[nodiscard]] bool skipIfRunning() const override { return spec_->skipRunning; }

    [[nodiscard]] RunStart run(RunOrigin origin);

    // Scales a replicated service back to zero once the run `generation`
    // completed or failed, unless a newer run has started since.
    void finish(const RunOutcome& outcome, std::uint64_t generation);

    // At most one event run per service; false when one is already active.
    [[nodiscard]] bool beginEventRun() noexcept;
    void endEventRun() noexcept;
    [[nodiscard]] bool eventRunActive() const noexcept { return state_->eventActive.load(); }

    [[nodiscard]] const JobSpec& spec() const noexcept { return *spec_; }
    [[nodiscard]] const std::shared_ptr<RunState>& state() const noexcept { return state_; }

private:
    std::shared_ptr<const JobSpec> spec_;
    Orchestrator& orchestrator_;
    RunTracker* tracker_;
    std::shared_ptr<RunState> state_;
};

// Releases the event-run slot of a runner on scope exit.
class EventRunGuard {
public:
    explicit EventRunGuard(JobRunner& runner) noexcept : runner_(runner) {}
    ~EventRunGuard() { runner_.endEventRun(); }

    EventRunGuard(const EventRunGuard&) = delete;
    EventRunGuard& operator=(const EventRunGuard&) = delete;

private:
    JobRunner& runner_;
};

}
