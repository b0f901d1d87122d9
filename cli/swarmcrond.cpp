/*
 * swarmcron - Server daemon (swarmcrond)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/config.hpp"
#include "swarmcron/docker.hpp"
#include "swarmcron/logger.hpp"
#include "swarmcron/server.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace swarmcron;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;
static volatile sig_atomic_t g_signal = 0;

void signalHandler(int signal) {
    g_signal = signal;
    g_shutdown_requested = 1;
}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "swarmcrond";

    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << usage(program);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    ConfigResult parsed = parseConfig(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.message << "\n\n" << usage(program);
        return 1;
    }
    const Config& config = parsed.config;

    Logger::setLevel(config.logLevel);
    Logger::setJson(config.logJson);
    setThreadName("Main");
    LOG_INFO("Starting swarmcron " + std::string(VERSION));

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    bool failed = false;
    try {
        CurlGlobal curl;
        Server server(config);

        if (!server.start()) {
            LOG_ERROR("Failed to start");
            return 1;
        }

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            LOG_WARN("Caught signal " + std::to_string(static_cast<int>(g_signal)));
        }
        failed = server.failed();
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("swarmcron daemon stopped");
    return failed ? 1 : 0;
}
