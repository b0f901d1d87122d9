/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/runner.hpp"
#include "swarmcron/logger.hpp"
#include "swarmcron/tracker.hpp"
#include <algorithm>

namespace swarmcron {

namespace {

void scaleDown(Orchestrator& orchestrator, const JobSpec& job, RunState& state, std::uint64_t generation,
               const RunOutcome& outcome) {
    if (outcome.kind != RunOutcome::Kind::Completed && outcome.kind != RunOutcome::Kind::Failed) {
        LOG_DEBUG("Leave " + job.name + " scaled up: run " + toString(outcome.kind));
        return;
    }

    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.generation != generation) {
        LOG_DEBUG("Leave " + job.name + " scaled up: a newer run has started");
        return;
    }

    try {
        ServiceInfo info = orchestrator.inspectService(job.name);
        if (info.mode != ServiceMode::Replicated) {
            return;
        }

        ServiceUpdate update;
        update.service = job.name;
        update.replicas = 0;
        update.labels[label::Scaledown] = "true";
        orchestrator.updateService(update);
        LOG_DEBUG("Job " + job.name + " scaled down");
    } catch (const OrchestratorError& e) {
        LOG_WARN("Cannot scale down " + job.name + ": " + std::string(e.what()));
    }
}

}

bool isLiveTask(const TaskInfo& task) noexcept {
    switch (task.state) {
        case TaskState::New:
        case TaskState::Pending:
        case TaskState::Assigned:
        case TaskState::Accepted:
        case TaskState::Preparing:
        case TaskState::Ready:
        case TaskState::Starting:
            return task.desiredState == TaskState::Running;
        case TaskState::Running:
            return true;
        default:
            return false;
    }
}

JobRunner::JobRunner(std::shared_ptr<const JobSpec> spec, Orchestrator& orchestrator, RunTracker* tracker,
                     std::shared_ptr<RunState> state)
    : spec_(std::move(spec)), orchestrator_(orchestrator), tracker_(tracker),
      state_(state ? std::move(state) : std::make_shared<RunState>()) {
}

void JobRunner::trigger() {
    RunStart start = run(RunOrigin::Schedule);
    if (!start) {
        if (start.status == RunStatus::Failed) {
            LOG_ERROR("Scheduled run of " + spec_->name + " failed: " + start.error);
        }
        return;
    }

    // Fire-and-forget: the outcome is only logged, then the service is scaled down
    if (tracker_) {
        Orchestrator& orchestrator = orchestrator_;
        auto onDone = [&orchestrator, spec = spec_, state = state_, generation = start.generation](
                          const RunOutcome& outcome) { scaleDown(orchestrator, *spec, *state, generation, outcome); };
        tracker_->track(spec_->name, std::move(start.baseline), std::move(onDone));
    }
}

RunStart JobRunner::run(RunOrigin origin) {
    RunStart result;
    const JobSpec& job = *spec_;

    std::lock_guard<std::mutex> lock(state_->mutex);

    if (origin == RunOrigin::Schedule && state_->eventActive.load()) {
        LOG_INFO("Skip scheduled run of " + job.name + ": event-triggered run in progress");
        result.status = RunStatus::Skipped;
        return result;
    }

    LOG_INFO("Start job " + job.name + (origin == RunOrigin::Event ? " (event)" : ""));

    try {
        // Step 1: snapshot current tasks
        result.baseline = orchestrator_.listTasks(job.name);

        // Step 2: skip-running policy
        if (job.skipRunning) {
            auto live = std::count_if(result.baseline.begin(), result.baseline.end(), isLiveTask);
            if (live > 0) {
                LOG_INFO("Skip job " + job.name + ": " + std::to_string(live) + " task(s) still running");
                result.status = RunStatus::Skipped;
                return result;
            }
        }

        // Step 3: scale up and force a new rollout
        ServiceUpdate update;
        update.service = job.name;
        update.replicas = job.replicas;
        update.forceUpdate = true;
        update.registryAuth = job.registryAuth;
        update.labels[label::Scaledown] = std::nullopt;
        orchestrator_.updateService(update);

        LOG_DEBUG("Job " + job.name + " triggered with " + std::to_string(job.replicas) + " replica(s)");
        result.status = RunStatus::Started;
        result.generation = ++state_->generation;
        return result;

    } catch (const OrchestratorError& e) {
        result.status = RunStatus::Failed;
        result.error = e.what();
        return result;
    }
}

void JobRunner::finish(const RunOutcome& outcome, std::uint64_t generation) {
    scaleDown(orchestrator_, *spec_, *state_, generation, outcome);
}

bool JobRunner::beginEventRun() noexcept {
    bool expected = false;
    return state_->eventActive.compare_exchange_strong(expected, true);
}

void JobRunner::endEventRun() noexcept {
    state_->eventActive.store(false);
}

}
