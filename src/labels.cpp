/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/labels.hpp"
#include "swarmcron/duration.hpp"
#include "swarmcron/logger.hpp"
#include <cctype>
#include <limits>

namespace swarmcron {

namespace {

bool parseUnsigned(const std::string& value, std::uint64_t& out) noexcept {
    if (value.empty()) {
        return false;
    }
    std::uint64_t result = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (result > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return false;
        }
        result = result * 10 + digit;
    }
    out = result;
    return true;
}

}

bool parseBool(const std::string& value, bool& out) noexcept {
    if (value == "1" || value == "t" || value == "T" || value == "TRUE" ||
        value == "true" || value == "True") {
        out = true;
        return true;
    }
    if (value == "0" || value == "f" || value == "F" || value == "FALSE" ||
        value == "false" || value == "False") {
        out = false;
        return true;
    }
    return false;
}

LabelParseResult buildJobSpec(const std::string& serviceName, const Labels& labels) {
    LabelParseResult result;
    result.spec.name = serviceName;

    auto fail = [&](const std::string& key, const std::string& value, const std::string& message) {
        result.errors.push_back({key, value, message});
    };

    auto boolField = [&](const std::string& key, const std::string& value, bool& field) {
        bool parsed = false;
        if (parseBool(value, parsed)) {
            field = parsed;
        } else {
            fail(key, value, "Cannot parse " + value + " value of label " + key);
        }
    };

    for (const auto& [key, value] : labels) {
        if (key == label::Enable) {
            boolField(key, value, result.spec.enabled);
        } else if (key == label::Schedule) {
            result.spec.schedule = value;
        } else if (key == label::EventEnable) {
            boolField(key, value, result.spec.eventEnabled);
        } else if (key == label::EventKey) {
            result.spec.eventKey = value;
        } else if (key == label::EventTimeout) {
            // Stored raw, re-parsed when a trigger needs it
            result.spec.eventTimeout = value;
            if (!parseDuration(value)) {
                fail(key, value, "Cannot parse " + value + " value of label " + key);
            }
        } else if (key == label::SkipRunning) {
            boolField(key, value, result.spec.skipRunning);
        } else if (key == label::Replicas) {
            std::uint64_t replicas = 0;
            if (!parseUnsigned(value, replicas)) {
                fail(key, value, "Cannot parse " + value + " value of label " + key);
            } else if (replicas < 1) {
                fail(key, value, std::string(key) + " must be greater than or equal to one");
            } else {
                result.spec.replicas = replicas;
            }
        } else if (key == label::RegistryAuth) {
            boolField(key, value, result.spec.registryAuth);
        } else if (key == label::Scaledown) {
            if (value == "true") {
                result.scaledown = true;
            }
        }
    }

    for (const auto& err : result.errors) {
        LOG_ERROR(err.message + " (service: " + serviceName + ")");
    }

    return result;
}

}
