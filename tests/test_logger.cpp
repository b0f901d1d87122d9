/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <thread>

#include "swarmcron/logger.hpp"

using namespace swarmcron;

TEST(LoggerTest, ParsesLevels) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARN"), LogLevel::WARN);
    EXPECT_FALSE(Logger::parseLevel("loud").has_value());
}

TEST(LoggerTest, ThreadNameDefaultsToId) {
    std::string name;
    std::thread([&] { name = threadName(); }).join();
    ASSERT_FALSE(name.empty());
    EXPECT_EQ(name[0], 'T');
}

TEST(LoggerTest, ScopedThreadNameIsDroppedOnExit) {
    std::string inside;
    std::string after;
    std::thread([&] {
        {
            ScopedThreadName named("Event-backup");
            inside = threadName();
        }
        after = threadName();
    }).join();

    EXPECT_EQ(inside, "Event-backup");
    EXPECT_NE(after, "Event-backup");
    EXPECT_EQ(after[0], 'T');
}

TEST(LoggerTest, ClearThreadName) {
    std::string named;
    std::string cleared;
    std::thread([&] {
        setThreadName("Worker-1");
        named = threadName();
        clearThreadName();
        cleared = threadName();
    }).join();

    EXPECT_EQ(named, "Worker-1");
    EXPECT_NE(cleared, "Worker-1");
}
