/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <future>
#include <thread>

#include "fake_orchestrator.hpp"
#include "swarmcron/registry.hpp"
#include "swarmcron/scheduler.hpp"
#include "swarmcron/trigger.hpp"
#include "swarmcron/waiter.hpp"

using namespace swarmcron;
using namespace std::chrono_literals;
using swarmcron::test::FakeOrchestrator;
using swarmcron::test::makeTask;

class TriggerTest : public ::testing::Test {
protected:
    JobSpec eventJob(const std::string& name, const std::string& key = "s3cr3t") {
        JobSpec spec;
        spec.name = name;
        spec.enabled = true;
        spec.schedule = "@hourly";
        spec.eventEnabled = true;
        spec.eventKey = key;
        return spec;
    }

    void registerJob(const JobSpec& spec) {
        ASSERT_TRUE(registry.add(spec).ok);
    }

    FakeOrchestrator cluster;
    Scheduler scheduler{1};
    ScheduleRegistry registry{scheduler, cluster};
    CompletionWaiter waiter{cluster, 10ms};
    TriggerService triggers{registry, waiter, 2s};
};

TEST_F(TriggerTest, UnknownServiceFails) {
    auto result = triggers.handle("ghost", "anything");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.body, "service ghost not found");
}

TEST_F(TriggerTest, KeyMismatchRunsNothing) {
    registerJob(eventJob("backup"));

    auto result = triggers.handle("backup", "wrong");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.body, "event run rejected for service backup");
    EXPECT_EQ(cluster.listTasksCalls("backup"), 0);
    EXPECT_TRUE(cluster.updates().empty());
}

TEST_F(TriggerTest, DisabledEventsAreRejectedTheSameWay) {
    JobSpec spec = eventJob("backup");
    spec.eventEnabled = false;
    registerJob(spec);

    auto result = triggers.handle("backup", "s3cr3t");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.body, "event run rejected for service backup");
    EXPECT_EQ(cluster.listTasksCalls("backup"), 0);
    EXPECT_TRUE(cluster.updates().empty());
}

TEST_F(TriggerTest, EmptyKeyMatchesOnlyEmptyKey) {
    registerJob(eventJob("backup", ""));
    cluster.scriptTasks("backup", {{}, {makeTask("C", TaskState::Complete)}});
    cluster.setLogs("C", "ok");

    EXPECT_FALSE(triggers.handle("backup", "x").ok);
    EXPECT_TRUE(triggers.handle("backup", "").ok);
}

TEST_F(TriggerTest, SuccessReturnsLogs) {
    registerJob(eventJob("backup"));
    cluster.scriptTasks("backup", {
        {makeTask("A", TaskState::Complete)},
        {makeTask("A", TaskState::Complete), makeTask("C", TaskState::Running)},
        {makeTask("A", TaskState::Complete), makeTask("C", TaskState::Complete)},
    });
    cluster.setLogs("A", "previous run\n");
    cluster.setLogs("C", "backup finished\n");

    auto result = triggers.handle("backup", "s3cr3t");

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.body, "backup finished\n");

    auto updates = cluster.updates();
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_TRUE(updates[0].forceUpdate);
}

TEST_F(TriggerTest, FailedTaskReturnsReason) {
    registerJob(eventJob("backup"));
    cluster.scriptTasks("backup", {{}, {makeTask("C", TaskState::Failed, "exit status 2")}});

    auto result = triggers.handle("backup", "s3cr3t");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.body, "exit status 2");
}

TEST_F(TriggerTest, TimeoutUsesJobLabel) {
    JobSpec spec = eventJob("backup");
    spec.eventTimeout = "200ms";
    registerJob(spec);

    auto started = std::chrono::steady_clock::now();
    auto result = triggers.handle("backup", "s3cr3t");
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.body, "Timeout");
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 1500ms);
}

TEST_F(TriggerTest, UpdateFailureIsReported) {
    registerJob(eventJob("backup"));
    cluster.failUpdate(true);

    auto result = triggers.handle("backup", "s3cr3t");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.body, "update rejected");
}

TEST_F(TriggerTest, SkipRunningPolicyApplies) {
    JobSpec spec = eventJob("backup");
    spec.skipRunning = true;
    registerJob(spec);
    cluster.scriptTasks("backup", {{makeTask("A", TaskState::Running)}});

    auto result = triggers.handle("backup", "s3cr3t");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.body, "job backup is still running");
    EXPECT_TRUE(cluster.updates().empty());
}

TEST_F(TriggerTest, SecondEventRunIsRefused) {
    registerJob(eventJob("backup"));
    auto job = registry.find("backup");
    ASSERT_TRUE(job.has_value());
    ASSERT_TRUE(job->runner->beginEventRun());

    auto result = triggers.handle("backup", "s3cr3t");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.body, "event run already in progress for service backup");
    EXPECT_TRUE(cluster.updates().empty());
    job->runner->endEventRun();
}

TEST_F(TriggerTest, EventRunSlotIsReleased) {
    JobSpec spec = eventJob("backup");
    spec.eventTimeout = "50ms";
    registerJob(spec);

    EXPECT_EQ(triggers.handle("backup", "s3cr3t").body, "Timeout");
    EXPECT_FALSE(registry.find("backup")->runner->eventRunActive());
    EXPECT_EQ(triggers.handle("backup", "s3cr3t").body, "Timeout");
}

TEST_F(TriggerTest, CancelledWait) {
    registerJob(eventJob("backup"));
    CancelToken token;
    token.cancel();

    auto result = triggers.handle("backup", "s3cr3t", &token);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.body, "Cancelled");
}

TEST_F(TriggerTest, TimeoutForJob) {
    JobSpec spec = eventJob("backup");

    EXPECT_EQ(triggers.timeoutFor(spec), Duration(2s));

    spec.eventTimeout = "500ms";
    EXPECT_EQ(triggers.timeoutFor(spec), Duration(500ms));

    spec.eventTimeout = "1h";
    EXPECT_EQ(triggers.timeoutFor(spec), Duration(2s));

    for (const char* bad : {"soon", "0s", "-5s"}) {
        spec.eventTimeout = bad;
        EXPECT_EQ(triggers.timeoutFor(spec), Duration(2s)) << bad;
    }
}

TEST_F(TriggerTest, ScalesDownAfterTheEventRun) {
    registerJob(eventJob("backup"));
    cluster.setService("backup", {});
    cluster.scriptTasks("backup", {{}, {makeTask("C", TaskState::Complete)}});
    cluster.setLogs("C", "done\n");

    ASSERT_TRUE(triggers.handle("backup", "s3cr3t").ok);

    auto updates = cluster.updates();
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_TRUE(updates[0].forceUpdate);
    EXPECT_EQ(updates[1].replicas, std::optional<std::uint64_t>(0));
    EXPECT_EQ(updates[1].labels.at(label::Scaledown), std::optional<std::string>("true"));
}

TEST_F(TriggerTest, TimedOutEventRunIsNotScaledDown) {
    JobSpec spec = eventJob("backup");
    spec.eventTimeout = "50ms";
    registerJob(spec);
    cluster.setService("backup", {});

    EXPECT_EQ(triggers.handle("backup", "s3cr3t").body, "Timeout");
    EXPECT_EQ(cluster.updates().size(), 1u);
}

TEST_F(TriggerTest, ReplacedJobStillRefusesSecondEventRun) {
    registerJob(eventJob("backup"));
    CancelToken token;
    auto pending = std::async(std::launch::async, [&] { return triggers.handle("backup", "s3cr3t", &token); });

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!registry.find("backup")->runner->eventRunActive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(registry.find("backup")->runner->eventRunActive());

    // A label update arrives while the first run is waiting
    ASSERT_TRUE(registry.replace(eventJob("backup")).ok);

    auto second = triggers.handle("backup", "s3cr3t");
    EXPECT_FALSE(second.ok);
    EXPECT_EQ(second.body, "event run already in progress for service backup");
    EXPECT_EQ(registry.find("backup")->runner->run(RunOrigin::Schedule).status, RunStatus::Skipped);

    token.cancel();
    EXPECT_EQ(pending.get().body, "Cancelled");
    EXPECT_FALSE(registry.find("backup")->runner->eventRunActive());
    EXPECT_EQ(cluster.updates().size(), 1u);
}
