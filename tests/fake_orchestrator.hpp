/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "swarmcron/orchestrator.hpp"

namespace swarmcron::test {

inline TaskInfo makeTask(const std::string& id, TaskState state, const std::string& error = "") {
    TaskInfo task;
    task.id = id;
    task.state = state;
    task.desiredState = TaskState::Running;
    task.error = error;
    return task;
}

inline Labels cronLabels(const std::string& schedule, const std::string& enable = "true") {
    return Labels{{"swarm.cronjob.enable", enable}, {"swarm.cronjob.schedule", schedule}};
}

// Event feed driven by the test through push()/fail().
class FakeEventStream final : public EventStream {
public:
    struct State {
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<StreamItem> items;
    };

    explicit FakeEventStream(std::shared_ptr<State> state) : state_(std::move(state)) {}

    StreamItem next() override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->ready.wait(lock, [this] { return !state_->items.empty(); });
        StreamItem item = state_->items.front();
        if (item.kind == StreamItem::Kind::Message) {
            state_->items.pop_front();
        }
        return item;
    }

    void close() noexcept override {
        StreamItem item;
        item.kind = StreamItem::Kind::Error;
        item.error = "closed";
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->items.push_back(item);
        }
        state_->ready.notify_all();
    }

private:
    std::shared_ptr<State> state_;
};

// In-memory cluster. Task lists can be scripted per service: each
// listTasks() call consumes the next scripted snapshot and the last one
// repeats once the script is exhausted.
class FakeOrchestrator final : public Orchestrator {
public:
    void setService(const std::string& name, Labels labels) {
        std::lock_guard<std::mutex> lock(mutex_);
        ServiceInfo info;
        info.id = "id-" + name;
        info.name = name;
        info.version = 1;
        info.replicas = 0;
        info.image = "alpine:latest";
        info.labels = std::move(labels);
        services_[name] = info;
        inspectErrors_.erase(name);
    }

    void setGlobal(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        services_[name].mode = ServiceMode::Global;
    }

    void removeService(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        services_.erase(name);
    }

    void failInspect(const std::string& name, int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        inspectErrors_[name] = status;
    }

    void scriptTasks(const std::string& service, std::vector<TaskSnapshot> polls) {
        std::lock_guard<std::mutex> lock(mutex_);
        taskScripts_[service] = std::deque<TaskSnapshot>(polls.begin(), polls.end());
    }

    void failListTasks(const std::string& service, bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        listTasksFails_[service] = fail;
    }

    void failUpdate(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        updateFails_ = fail;
    }

    void setLogs(const std::string& taskId, const std::string& logs) {
        std::lock_guard<std::mutex> lock(mutex_);
        logs_[taskId] = logs;
    }

    void pushEvent(const std::string& service) {
        StreamItem item;
        item.message.type = "service";
        item.message.action = "update";
        item.message.actorId = "id-" + service;
        item.message.attributes["name"] = service;
        item.message.attributes["updatestate.new"] = "updating";
        push(std::move(item));
    }

    void pushRaw(EventMessage message) {
        StreamItem item;
        item.message = std::move(message);
        push(std::move(item));
    }

    void failStream(const std::string& error) {
        StreamItem item;
        item.kind = StreamItem::Kind::Error;
        item.error = error;
        push(std::move(item));
    }

    [[nodiscard]] int listTasksCalls(const std::string& service) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listTasksCalls_.find(service);
        return it == listTasksCalls_.end() ? 0 : it->second;
    }

    [[nodiscard]] std::vector<ServiceUpdate> updates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return updates_;
    }

    [[nodiscard]] int inspectCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inspectCalls_;
    }

    std::vector<ServiceInfo> listServices(const std::vector<std::string>& labelKeys) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ServiceInfo> out;
        for (const auto& [name, info] : services_) {
            bool all = true;
            for (const auto& key : labelKeys) {
                all = all && info.labels.count(key) > 0;
            }
            if (all) {
                out.push_back(info);
            }
        }
        return out;
    }

    ServiceInfo inspectService(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++inspectCalls_;
        auto err = inspectErrors_.find(name);
        if (err != inspectErrors_.end()) {
            throw OrchestratorError("inspect failed", err->second);
        }
        auto it = services_.find(name);
        if (it == services_.end()) {
            throw OrchestratorError("service " + name + " not found", 404);
        }
        return it->second;
    }

    std::vector<TaskInfo> listTasks(const std::string& service) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++listTasksCalls_[service];
        if (listTasksFails_[service]) {
            throw OrchestratorError("task list unavailable", 500);
        }
        auto& script = taskScripts_[service];
        if (script.empty()) {
            return {};
        }
        TaskSnapshot snapshot = script.front();
        if (script.size() > 1) {
            script.pop_front();
        }
        return snapshot;
    }

    std::string taskLogs(const std::string& taskId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = logs_.find(taskId);
        if (it == logs_.end()) {
            throw OrchestratorError("no logs for " + taskId, 404);
        }
        return it->second;
    }

    void updateService(const ServiceUpdate& update) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (updateFails_) {
            throw OrchestratorError("update rejected", 500);
        }
        updates_.push_back(update);
    }

    std::unique_ptr<EventStream> events(const std::string& type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        eventType_ = type;
        return std::make_unique<FakeEventStream>(stream_);
    }

    [[nodiscard]] std::string eventType() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return eventType_;
    }

private:
    void push(StreamItem item) {
        {
            std::lock_guard<std::mutex> lock(stream_->mutex);
            stream_->items.push_back(std::move(item));
        }
        stream_->ready.notify_all();
    }

    mutable std::mutex mutex_;
    std::map<std::string, ServiceInfo> services_;
    std::map<std::string, int> inspectErrors_;
    std::map<std::string, std::deque<TaskSnapshot>> taskScripts_;
    std::map<std::string, bool> listTasksFails_;
    std::map<std::string, std::string> logs_;
    std::map<std::string, int> listTasksCalls_;
    std::vector<ServiceUpdate> updates_;
    int inspectCalls_ = 0;
    bool updateFails_ = false;
    std::string eventType_;

    std::shared_ptr<FakeEventStream::State> stream_ = std::make_shared<FakeEventStream::State>();
};

}
