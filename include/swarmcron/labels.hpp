/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "swarmcron/types.hpp"

namespace swarmcron {

constexpr const char* kLabelPrefix = "swarm.cronjob.";

namespace label {
constexpr const char* Enable = "swarm.cronjob.enable";
constexpr const char* Schedule = "swarm.cronjob.schedule";
constexpr const char* EventEnable = "swarm.cronjob.event.enable";
constexpr const char* EventKey = "swarm.cronjob.event.key";
constexpr const char* EventTimeout = "swarm.cronjob.event.timeout";
constexpr const char* SkipRunning = "swarm.cronjob.skip-running";
constexpr const char* Replicas = "swarm.cronjob.replicas";
constexpr const char* RegistryAuth = "swarm.cronjob.registry-auth";
constexpr const char* Scaledown = "swarm.cronjob.scaledown";
}

// Job configuration derived from the labels of one service.
// Never modified once built; a label change produces a new JobSpec.
struct JobSpec {
    std::string name;
    bool enabled = false;
    std::string schedule;
    bool skipRunning = false;
    std::uint64_t replicas = 1;
    bool eventEnabled = false;
    std::string eventKey;
    std::string eventTimeout;
    bool registryAuth = false;
};

struct LabelError {
    std::string label;
    std::string value;
    std::string message;
};

struct LabelParseResult {
    JobSpec spec;
    bool scaledown = false;
    std::vector<LabelError> errors;
};

[[nodiscard]] LabelParseResult buildJobSpec(const std::string& serviceName, const Labels& labels);

// strconv.ParseBool spellings: 1 t T TRUE true True 0 f F FALSE false False
[[nodiscard]] bool parseBool(const std::string& value, bool& out) noexcept;

}
