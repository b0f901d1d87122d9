/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "swarmcron/orchestrator.hpp"
#include "swarmcron/reconciler.hpp"

namespace swarmcron {

struct ServiceEvent {
    std::string service;
    std::string oldState;
    std::string newState;
};

// nullopt when the actor attributes carry no service name.
[[nodiscard]] std::optional<ServiceEvent> decodeServiceEvent(const EventMessage& message);

// Feeds every service event of the cluster to the reconciler.
class Listener final {
public:
    Listener(Orchestrator& orchestrator, Reconciler& reconciler) noexcept;

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Blocks until the stream fails or stop() is called. Returns false on a
    // stream failure; the event model does not survive gaps.
    [[nodiscard]] bool run();
    void stop() noexcept;

    [[nodiscard]] std::size_t processed() const noexcept { return processed_.load(); }

private:
    void handle(const EventMessage& message);

    Orchestrator& orchestrator_;
    Reconciler& reconciler_;

    std::mutex streamMutex_;
    std::unique_ptr<EventStream> stream_;
    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> processed_{0};
};

}
