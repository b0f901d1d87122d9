/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/server.hpp"
#include "swarmcron/docker.hpp"
#include "swarmcron/http.hpp"
#include "swarmcron/listener.hpp"
#include "swarmcron/logger.hpp"
#include "swarmcron/reconciler.hpp"
#include "swarmcron/registry.hpp"
#include "swarmcron/scheduler.hpp"
#include "swarmcron/tracker.hpp"
#include "swarmcron/trigger.hpp"
#include "swarmcron/waiter.hpp"

namespace swarmcron {

// Note: Signal handling is done by the daemon (swarmcrond.cpp), not by Server class

Server::Server(Config config) : Server(std::move(config), nullptr) {
}

Server::Server(Config config, std::shared_ptr<Orchestrator> orchestrator)
    : config_(std::move(config)), orchestrator_(std::move(orchestrator)) {
    LOG_DEBUG("Server created - event port: " + std::to_string(config_.eventPort) +
              ", workers: " + std::to_string(config_.workers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (started_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_DEBUG("========================================");
    LOG_DEBUG("Docker host: " + config_.dockerHost);
    LOG_DEBUG("API version: " + config_.dockerApiVersion);
    LOG_DEBUG("Event port: " + std::to_string(config_.eventPort));
    LOG_DEBUG("Event timeout: " + formatDuration(config_.eventTimeout));
    LOG_DEBUG("Poll interval: " + std::to_string(config_.pollInterval.count()) + "ms");
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));
    LOG_DEBUG("========================================");

    try {
        if (!orchestrator_) {
            LOG_DEBUG("Creating Docker API client");
            auto docker = std::make_shared<DockerClient>(config_.dockerHost, config_.dockerApiVersion);
            docker->ping();
            orchestrator_ = std::move(docker);
        }

        waiter_ = std::make_unique<CompletionWaiter>(*orchestrator_, config_.pollInterval);
        tracker_ = std::make_unique<RunTracker>(*waiter_, config_.eventTimeout);
        scheduler_ = std::make_unique<Scheduler>(config_.workers);
        registry_ = std::make_unique<ScheduleRegistry>(*scheduler_, *orchestrator_, tracker_.get());
        reconciler_ = std::make_unique<Reconciler>(*orchestrator_, *registry_);
        listener_ = std::make_unique<Listener>(*orchestrator_, *reconciler_);
        triggers_ = std::make_unique<TriggerService>(*registry_, *waiter_, config_.eventTimeout);
        http_ = std::make_unique<TriggerServer>(*triggers_, config_.eventAddress, config_.eventPort);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot initialize swarmcron: " + std::string(e.what()));
        return false;
    }

    started_.store(true);
    shutdown_.store(false);
    failed_.store(false);

    if (!tracker_->start()) {
        LOG_ERROR("Failed to start run tracker");
        shutdown();
        return false;
    }

    if (!http_->start()) {
        LOG_ERROR("Failed to start event server");
        shutdown();
        return false;
    }

    // Rebuild the schedule from the live service listing
    if (!reconciler_->reconcileAll()) {
        shutdown();
        return false;
    }
    LOG_DEBUG("Number of cronjob tasks: " + std::to_string(registry_->size()));

    LOG_DEBUG("Starting the cron scheduler");
    if (!scheduler_->start()) {
        LOG_ERROR("Failed to start scheduler");
        shutdown();
        return false;
    }

    running_.store(true);
    try {
        listenerThread_ = std::thread(&Server::listenLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start event listener: " + std::string(e.what()));
        shutdown();
        return false;
    }

    LOG_INFO("swarmcron started with " + std::to_string(registry_->size()) + " scheduled service(s)");
    return true;
}

void Server::shutdown() noexcept {
    if (!started_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (listener_) {
        listener_->stop();
    }
    if (listenerThread_.joinable()) {
        listenerThread_.join();
    }

    // In-flight event requests are cancelled here
    if (http_) {
        http_->stop();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
    if (tracker_) {
        tracker_->stop();
    }

    LOG_INFO("Server shutdown complete");
}

void Server::listenLoop() {
    bool ok = listener_->run();
    if (!ok && !shutdown_.load()) {
        LOG_ERROR("Event listener stopped, shutting down");
        failed_.store(true);
        running_.store(false);
    }
}

}
