/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/types.hpp"

namespace swarmcron {

TaskState parseTaskState(const std::string& value) noexcept {
    if (value == "new") return TaskState::New;
    if (value == "pending") return TaskState::Pending;
    if (value == "assigned") return TaskState::Assigned;
    if (value == "accepted") return TaskState::Accepted;
    if (value == "preparing") return TaskState::Preparing;
    if (value == "ready") return TaskState::Ready;
    if (value == "starting") return TaskState::Starting;
    if (value == "running") return TaskState::Running;
    if (value == "complete") return TaskState::Complete;
    if (value == "shutdown") return TaskState::Shutdown;
    if (value == "failed") return TaskState::Failed;
    if (value == "rejected") return TaskState::Rejected;
    if (value == "remove") return TaskState::Remove;
    if (value == "orphaned") return TaskState::Orphaned;
    return TaskState::Unknown;
}

const char* toString(TaskState state) noexcept {
    switch (state) {
        case TaskState::New: return "new";
        case TaskState::Pending: return "pending";
        case TaskState::Assigned: return "assigned";
        case TaskState::Accepted: return "accepted";
        case TaskState::Preparing: return "preparing";
        case TaskState::Ready: return "ready";
        case TaskState::Starting: return "starting";
        case TaskState::Running: return "running";
        case TaskState::Complete: return "complete";
        case TaskState::Shutdown: return "shutdown";
        case TaskState::Failed: return "failed";
        case TaskState::Rejected: return "rejected";
        case TaskState::Remove: return "remove";
        case TaskState::Orphaned: return "orphaned";
        default: return "unknown";
    }
}

}
