/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <thread>

#include "swarmcron/config.hpp"

namespace swarmcron {

class Orchestrator;
class Scheduler;
class CompletionWaiter;
class RunTracker;
class ScheduleRegistry;
class Reconciler;
class Listener;
class TriggerService;
class TriggerServer;

class Server final {
public:
    // Talks to the Docker engine named by config.dockerHost
    explicit Server(Config config);
    Server(Config config, std::shared_ptr<Orchestrator> orchestrator);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    // False once shutdown() ran or the event stream broke
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    // True when the event stream broke; the process should exit non-zero
    [[nodiscard]] bool failed() const noexcept { return failed_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] ScheduleRegistry* registry() const noexcept { return registry_.get(); }
    [[nodiscard]] TriggerServer* http() const noexcept { return http_.get(); }

private:
    void listenLoop();

    Config config_;
    std::shared_ptr<Orchestrator> orchestrator_;

    std::unique_ptr<CompletionWaiter> waiter_;
    std::unique_ptr<RunTracker> tracker_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<ScheduleRegistry> registry_;
    std::unique_ptr<Reconciler> reconciler_;
    std::unique_ptr<Listener> listener_;
    std::unique_ptr<TriggerService> triggers_;
    std::unique_ptr<TriggerServer> http_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<bool> failed_{false};

    std::thread listenerThread_;
};

}
