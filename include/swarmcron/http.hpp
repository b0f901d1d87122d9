/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace swarmcron {

class TriggerService;

struct TriggerRoute {
    std::string service;
    std::string key;
};

// Matches `/event/{service}/{key}` (query string ignored, segments
// percent-decoded). nullopt for any other path.
[[nodiscard]] std::optional<TriggerRoute> matchTriggerRoute(const std::string& target);

// HTTP front of the trigger service. One io thread accepts and reads
// requests; each matched request runs on its own thread because the wait
// can last up to the event timeout.
class TriggerServer final {
public:
    TriggerServer(TriggerService& triggers, std::string address, std::uint16_t port);
    ~TriggerServer();

    TriggerServer(const TriggerServer&) = delete;
    TriggerServer& operator=(const TriggerServer&) = delete;
    TriggerServer(TriggerServer&&) = delete;
    TriggerServer& operator=(TriggerServer&&) = delete;

    [[nodiscard]] bool start();
    // Cancels pending waits, then joins request and io threads.
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    // Bound port; differs from the requested one when that was 0.
    [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_.load(); }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> boundPort_{0};
};

}
