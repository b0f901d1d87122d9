#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace swarmcron {

// Swarm task lifecycle states, as reported by the engine.
enum class TaskState : std::uint8_t {
    New, Pending, Assigned, Accepted, Preparing, Ready, Starting,
    Running, Complete, Shutdown, Failed, Rejected, Remove, Orphaned, Unknown
};

enum class ServiceMode : std::uint8_t { Replicated, Global };

using Labels = std::map<std::string, std::string>;

struct ServiceInfo {
    std::string id;
    std::string name;
    std::uint64_t version = 0;
    ServiceMode mode = ServiceMode::Replicated;
    std::uint64_t replicas = 0;
    std::string image;
    Labels labels;
};

struct TaskInfo {
    std::string id;
    std::string serviceId;
    TaskState state = TaskState::Unknown;
    TaskState desiredState = TaskState::Unknown;
    std::string message;
    std::string error;
};

using TaskSnapshot = std::vector<TaskInfo>;

[[nodiscard]] TaskState parseTaskState(const std::string& value) noexcept;
[[nodiscard]] const char* toString(TaskState state) noexcept;

} // namespace swarmcron
