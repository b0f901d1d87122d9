/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "swarmcron/orchestrator.hpp"
#include "swarmcron/types.hpp"

namespace swarmcron {

// Decoders for Docker Engine API payloads. They throw
// nlohmann::json::exception on documents of the wrong shape.
[[nodiscard]] ServiceInfo parseServiceJson(const nlohmann::json& j);
[[nodiscard]] TaskInfo parseTaskJson(const nlohmann::json& j);
[[nodiscard]] EventMessage parseEventJson(const nlohmann::json& j);

// Strips the 8-byte stdout/stderr frame headers of a non-TTY log stream.
// Input that is not framed is returned unchanged.
[[nodiscard]] std::string decodeLogStream(const std::string& raw);

// "nginx@sha256:..." -> "nginx"
[[nodiscard]] std::string normalizeImage(const std::string& image);

// Registry an image is pulled from, as keyed in ~/.docker/config.json.
[[nodiscard]] std::string registryHost(const std::string& image);

// X-Registry-Auth value for `image` from a parsed docker config file,
// nullopt when the config holds no inline credentials for its registry.
[[nodiscard]] std::optional<std::string> encodeRegistryAuth(const nlohmann::json& dockerConfig,
                                                            const std::string& image);

// Process-wide libcurl setup. Create one before the first DockerClient and
// keep it alive until every client is gone.
class CurlGlobal final {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Docker Engine API client over libcurl. Every call uses its own easy handle,
// so one client can be shared by all threads.
class DockerClient final : public Orchestrator {
public:
    // host: unix:///path, tcp://host:port or http(s)://host:port
    DockerClient(const std::string& host, std::string apiVersion);

    DockerClient(const DockerClient&) = delete;
    DockerClient& operator=(const DockerClient&) = delete;

    // Throws OrchestratorError when the daemon does not answer.
    void ping();

    [[nodiscard]] std::vector<ServiceInfo> listServices(const std::vector<std::string>& labelKeys) override;
    [[nodiscard]] ServiceInfo inspectService(const std::string& name) override;
    [[nodiscard]] std::vector<TaskInfo> listTasks(const std::string& service) override;
    [[nodiscard]] std::string taskLogs(const std::string& taskId) override;
    void updateService(const ServiceUpdate& update) override;
    [[nodiscard]] std::unique_ptr<EventStream> events(const std::string& type) override;

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    [[nodiscard]] Response request(const std::string& method, const std::string& path,
                                   const std::string& body = "",
                                   const std::vector<std::string>& headers = {}) const;
    [[nodiscard]] nlohmann::json requestJson(const std::string& method, const std::string& path,
                                             const std::string& body = "",
                                             const std::vector<std::string>& headers = {}) const;
    [[nodiscard]] std::string url(const std::string& path) const;
    [[nodiscard]] std::string registryAuthFor(const std::string& image) const;

    std::string baseUrl_;
    std::string socketPath_;
    std::string apiVersion_;
    std::chrono::seconds timeout_{60};
};

}
