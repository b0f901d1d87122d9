/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/listener.hpp"
#include "swarmcron/logger.hpp"

namespace swarmcron {

std::optional<ServiceEvent> decodeServiceEvent(const EventMessage& message) {
    auto attr = [&message](const char* key) -> std::string {
        auto it = message.attributes.find(key);
        return it == message.attributes.end() ? std::string() : it->second;
    };

    ServiceEvent event;
    event.service = attr("name");
    if (event.service.empty()) {
        return std::nullopt;
    }
    event.oldState = attr("updatestate.old");
    event.newState = attr("updatestate.new");
    return event;
}

Listener::Listener(Orchestrator& orchestrator, Reconciler& reconciler) noexcept
    : orchestrator_(orchestrator), reconciler_(reconciler) {
}

bool Listener::run() {
    setThreadName("Listener");
    LOG_DEBUG("Listening docker events...");

    try {
        auto stream = orchestrator_.events("service");
        std::lock_guard<std::mutex> lock(streamMutex_);
        stream_ = std::move(stream);
    } catch (const OrchestratorError& e) {
        LOG_ERROR("Cannot open event stream: " + std::string(e.what()));
        return false;
    }
    if (stopping_.load()) {
        return true;
    }

    while (true) {
        StreamItem item = stream_->next();

        if (item.kind == StreamItem::Kind::Error) {
            if (stopping_.load()) {
                LOG_DEBUG("Event stream closed");
                return true;
            }
            LOG_ERROR("Event channel failed: " + item.error);
            return false;
        }

        handle(item.message);
    }
}

void Listener::stop() noexcept {
    stopping_.store(true);
    std::lock_guard<std::mutex> lock(streamMutex_);
    if (stream_) {
        stream_->close();
    }
}

void Listener::handle(const EventMessage& message) {
    auto event = decodeServiceEvent(message);
    if (!event) {
        LOG_WARN("Cannot decode event " + message.type + "/" + message.action + " from " + message.actorId +
                 ": no service name");
        return;
    }

    LOG_DEBUG("Event triggered (service: " + event->service + ", newstate: " + event->newState +
              ", oldstate: " + event->oldState + ")");

    ReconcileResult result = reconciler_.reconcile(event->service);
    processed_.fetch_add(1);
    if (!result) {
        LOG_ERROR("Cannot manage job (service: " + event->service + "): " + result.error);
    }
}

}
