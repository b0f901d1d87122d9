/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "swarmcron/orchestrator.hpp"
#include "swarmcron/registry.hpp"

namespace swarmcron {

struct ReconcileResult {
    bool ok = true;
    bool changed = false;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Drives the registry entry of one service to match its current labels.
// Calls for the same service are serialised; different services run in parallel.
class Reconciler final {
public:
    Reconciler(Orchestrator& orchestrator, ScheduleRegistry& registry) noexcept;

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    [[nodiscard]] ReconcileResult reconcile(const std::string& service);

    // Startup rebuild from the services labelled enable + schedule.
    // Returns false when the service listing itself fails.
    [[nodiscard]] bool reconcileAll();

private:
    [[nodiscard]] std::shared_ptr<std::mutex> lockFor(const std::string& service);
    [[nodiscard]] ReconcileResult reconcileLocked(const std::string& service);

    Orchestrator& orchestrator_;
    ScheduleRegistry& registry_;

    std::mutex locksMutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;
};

}
