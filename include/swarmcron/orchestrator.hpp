/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "swarmcron/types.hpp"

namespace swarmcron {

class OrchestratorError : public std::runtime_error {
public:
    explicit OrchestratorError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] bool notFound() const noexcept { return status_ == 404; }

private:
    int status_;
};

struct EventMessage {
    std::string type;
    std::string action;
    std::string actorId;
    std::map<std::string, std::string> attributes;
};

struct StreamItem {
    enum class Kind : std::uint8_t { Message, Error };
    Kind kind = Kind::Message;
    EventMessage message;
    std::string error;
};

// Live event feed. next() blocks until either a message or an error is
// available; after an error the stream is finished.
class EventStream {
public:
    virtual ~EventStream() = default;
    [[nodiscard]] virtual StreamItem next() = 0;
    // Unblocks next() from another thread; it then reports an error.
    virtual void close() noexcept = 0;
};

struct ServiceUpdate {
    std::string service;
    std::optional<std::uint64_t> replicas;
    bool forceUpdate = false;
    bool registryAuth = false;
    std::map<std::string, std::optional<std::string>> labels;  // nullopt removes the label
};

// Narrow view of the cluster used by the job engine. Every call may
// throw OrchestratorError; implementations must be safe for concurrent use.
class Orchestrator {
public:
    virtual ~Orchestrator() = default;

    [[nodiscard]] virtual std::vector<ServiceInfo> listServices(const std::vector<std::string>& labelKeys) = 0;
    [[nodiscard]] virtual ServiceInfo inspectService(const std::string& name) = 0;
    [[nodiscard]] virtual std::vector<TaskInfo> listTasks(const std::string& service) = 0;
    [[nodiscard]] virtual std::string taskLogs(const std::string& taskId) = 0;
    virtual void updateService(const ServiceUpdate& update) = 0;
    [[nodiscard]] virtual std::unique_ptr<EventStream> events(const std::string& type) = 0;
};

}
