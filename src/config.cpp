/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/config.hpp"
#include <cctype>
#include <cstdlib>
#include <optional>

namespace swarmcron {

namespace {

bool isNumber(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::optional<long> parsePositive(const std::string& value, long max) {
    if (!isNumber(value) || value.size() > 9) {
        return std::nullopt;
    }
    long n = std::stol(value);
    if (n < 1 || n > max) {
        return std::nullopt;
    }
    return n;
}

// Applies one setting; returns an error message or an empty string
std::string apply(Config& config, const std::string& name, const std::string& value) {
    auto invalid = [&]() { return "invalid value '" + value + "' for " + name; };

    if (name == "log-level") {
        auto level = Logger::parseLevel(value);
        if (!level) {
            return invalid();
        }
        config.logLevel = *level;
    } else if (name == "log-json") {
        bool json = false;
        if (value.empty()) {
            json = true;
        } else if (value == "1" || value == "true" || value == "TRUE" || value == "True") {
            json = true;
        } else if (value != "0" && value != "false" && value != "FALSE" && value != "False") {
            return invalid();
        }
        config.logJson = json;
    } else if (name == "event-port") {
        auto port = parsePositive(value, 65535);
        if (!port) {
            return invalid();
        }
        config.eventPort = static_cast<std::uint16_t>(*port);
    } else if (name == "event-timeout") {
        auto timeout = parseDuration(value);
        if (!timeout || *timeout <= Duration::zero()) {
            return invalid();
        }
        config.eventTimeout = *timeout;
    } else if (name == "poll-interval") {
        auto interval = parseDuration(value);
        auto ms = interval ? std::chrono::duration_cast<std::chrono::milliseconds>(*interval)
                           : std::chrono::milliseconds::zero();
        if (ms <= std::chrono::milliseconds::zero()) {
            return invalid();
        }
        config.pollInterval = ms;
    } else if (name == "workers") {
        auto workers = parsePositive(value, 256);
        if (!workers) {
            return invalid();
        }
        config.workers = static_cast<int>(*workers);
    } else if (name == "docker-host") {
        if (value.empty()) {
            return invalid();
        }
        config.dockerHost = value;
    } else if (name == "docker-api-version") {
        config.dockerApiVersion = value;
    } else {
        return "unknown option --" + name;
    }
    return "";
}

struct EnvBinding {
    const char* env;
    const char* name;
};

constexpr EnvBinding kEnvBindings[] = {
    {"LOG_LEVEL", "log-level"},
    {"LOG_JSON", "log-json"},
    {"EVENT_PORT", "event-port"},
    {"EVENT_TIMEOUT", "event-timeout"},
    {"POLL_INTERVAL", "poll-interval"},
    {"WORKERS", "workers"},
    {"DOCKER_HOST", "docker-host"},
    {"DOCKER_API_VERSION", "docker-api-version"},
};

}

ConfigResult parseConfig(int argc, const char* const argv[]) {
    ConfigResult result;

    for (const auto& binding : kEnvBindings) {
        const char* value = std::getenv(binding.env);
        if (!value || !*value) {
            continue;
        }
        std::string error = apply(result.config, binding.name, value);
        if (!error.empty()) {
            result.message = error + " (from " + binding.env + ")";
            return result;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            result.message = "unexpected argument '" + arg + "'";
            return result;
        }

        std::string name = arg.substr(2);
        std::string value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        } else if (name != "log-json") {
            if (i + 1 >= argc) {
                result.message = "missing value for --" + name;
                return result;
            }
            value = argv[++i];
        }

        std::string error = apply(result.config, name, value);
        if (!error.empty()) {
            result.message = error;
            return result;
        }
    }

    result.ok = true;
    return result;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "\n"
           "Create jobs on a time-based schedule on Docker Swarm.\n"
           "\n"
           "Options:\n"
           "  --log-level <level>         error, warn, info, debug, trace (env LOG_LEVEL, default info)\n"
           "  --log-json[=<bool>]         JSON log lines (env LOG_JSON, default false)\n"
           "  --event-port <port>         port for event requests (env EVENT_PORT, default 8080)\n"
           "  --event-timeout <duration>  max time for an event job (env EVENT_TIMEOUT, default 1h)\n"
           "  --poll-interval <duration>  task polling interval (env POLL_INTERVAL, default 500ms)\n"
           "  --workers <n>               scheduler worker threads (env WORKERS, default 8)\n"
           "  --docker-host <url>         engine endpoint (env DOCKER_HOST, default unix:///var/run/docker.sock)\n"
           "  --docker-api-version <v>    engine API version (env DOCKER_API_VERSION, default 1.41)\n"
           "  -h, --help                  show this help\n"
           "  -v, --version               show version\n"
           "\n"
           "Schedules run in the daemon's local time. A TZ= or CRON_TZ= prefix is\n"
           "accepted only for UTC; other time zones make the schedule invalid.\n";
}

}
