/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/reconciler.hpp"
#include "swarmcron/labels.hpp"
#include "swarmcron/logger.hpp"

namespace swarmcron {

Reconciler::Reconciler(Orchestrator& orchestrator, ScheduleRegistry& registry) noexcept
    : orchestrator_(orchestrator), registry_(registry) {
}

ReconcileResult Reconciler::reconcile(const std::string& service) {
    auto lock = lockFor(service);
    std::lock_guard<std::mutex> guard(*lock);
    return reconcileLocked(service);
}

bool Reconciler::reconcileAll() {
    std::vector<ServiceInfo> services;
    try {
        services = orchestrator_.listServices({label::Enable, label::Schedule});
    } catch (const OrchestratorError& e) {
        LOG_ERROR("Cannot list scheduled services: " + std::string(e.what()));
        return false;
    }
    LOG_DEBUG(std::to_string(services.size()) + " scheduled services found through labels");

    for (const auto& service : services) {
        ReconcileResult result = reconcile(service.name);
        if (!result) {
            LOG_ERROR("Cannot manage job for service " + service.name + ": " + result.error);
        }
    }
    return true;
}

std::shared_ptr<std::mutex> Reconciler::lockFor(const std::string& service) {
    std::lock_guard<std::mutex> guard(locksMutex_);

    // Drop locks nobody holds any more
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.expired() && it->first != service) {
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }

    auto& slot = locks_[service];
    auto lock = slot.lock();
    if (!lock) {
        lock = std::make_shared<std::mutex>();
        slot = lock;
    }
    return lock;
}

ReconcileResult Reconciler::reconcileLocked(const std::string& service) {
    ReconcileResult result;
    const bool found = registry_.find(service).has_value();

    ServiceInfo info;
    try {
        info = orchestrator_.inspectService(service);
    } catch (const OrchestratorError& e) {
        if (!e.notFound()) {
            result.ok = false;
            result.error = "cannot inspect service " + service + ": " + e.what();
            return result;
        }
        if (found) {
            LOG_INFO("Remove cronjob (service: " + service + ")");
            (void)registry_.remove(service);
            result.changed = true;
        } else {
            LOG_DEBUG("Service " + service + " does not exist (removed)");
        }
        return result;
    }

    LabelParseResult parsed = buildJobSpec(service, info.labels);
    const JobSpec& spec = parsed.spec;

    if (parsed.scaledown) {
        LOG_DEBUG("Scale down detected. Skipping cronjob (service: " + service + ")");
        return result;
    }

    if (!spec.enabled) {
        if (found) {
            LOG_INFO("Disable cronjob (service: " + service + ")");
            (void)registry_.remove(service);
            result.changed = true;
        } else {
            LOG_DEBUG("Cronjob disabled (service: " + service + ")");
        }
        return result;
    }

    AddResult added;
    if (found) {
        LOG_DEBUG("Update cronjob with schedule " + spec.schedule + " (service: " + service + ")");
        added = registry_.replace(spec);
    } else {
        LOG_INFO("Add cronjob with schedule " + spec.schedule + " (service: " + service + ")");
        added = registry_.add(spec);
    }

    if (!added) {
        result.ok = false;
        result.changed = found;
        result.error = added.error;
        return result;
    }

    result.changed = true;
    return result;
}

}
