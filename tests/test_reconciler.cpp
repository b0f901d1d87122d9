/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "fake_orchestrator.hpp"
#include "swarmcron/reconciler.hpp"
#include "swarmcron/registry.hpp"
#include "swarmcron/scheduler.hpp"

using namespace swarmcron;
using swarmcron::test::FakeOrchestrator;
using swarmcron::test::cronLabels;

class ReconcilerTest : public ::testing::Test {
protected:
    FakeOrchestrator cluster;
    Scheduler scheduler{2};
    ScheduleRegistry registry{scheduler, cluster};
    Reconciler reconciler{cluster, registry};
};

TEST_F(ReconcilerTest, DisabledServiceIsNeverScheduled) {
    cluster.setService("a", cronLabels("@hourly", "false"));
    cluster.setService("b", Labels{{"swarm.cronjob.schedule", "@hourly"}});

    auto a = reconciler.reconcile("a");
    auto b = reconciler.reconcile("b");

    EXPECT_TRUE(a.ok);
    EXPECT_FALSE(a.changed);
    EXPECT_TRUE(b.ok);
    EXPECT_FALSE(b.changed);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(scheduler.size(), 0u);
}

TEST_F(ReconcilerTest, EnabledServiceGetsExactlyOneEntry) {
    cluster.setService("backup", cronLabels("*/5 * * * *"));

    auto first = reconciler.reconcile("backup");
    ASSERT_TRUE(first.ok) << first.error;
    EXPECT_TRUE(first.changed);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(scheduler.size(), 1u);

    auto job = registry.find("backup");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->runner->spec().schedule, "*/5 * * * *");
}

TEST_F(ReconcilerTest, SecondReconcileReplacesEntry) {
    cluster.setService("backup", cronLabels("*/5 * * * *"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    auto before = registry.find("backup");

    auto second = reconciler.reconcile("backup");

    EXPECT_TRUE(second.ok);
    EXPECT_TRUE(second.changed);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(scheduler.size(), 1u);
    auto after = registry.find("backup");
    ASSERT_TRUE(after.has_value());
    EXPECT_NE(after->entry, before->entry);
    EXPECT_EQ(after->runner->spec().schedule, before->runner->spec().schedule);
}

TEST_F(ReconcilerTest, UpdatePicksUpNewLabels) {
    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);

    Labels labels = cronLabels("@daily");
    labels["swarm.cronjob.replicas"] = "4";
    cluster.setService("backup", labels);
    ASSERT_TRUE(reconciler.reconcile("backup").ok);

    auto job = registry.find("backup");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->runner->spec().schedule, "@daily");
    EXPECT_EQ(job->runner->spec().replicas, 4u);
}

TEST_F(ReconcilerTest, ToggleEnableRoundTrips) {
    cluster.setService("other", cronLabels("@daily"));
    ASSERT_TRUE(reconciler.reconcile("other").ok);
    const auto baseline = registry.size();

    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    EXPECT_EQ(registry.size(), baseline + 1);

    cluster.setService("backup", cronLabels("@hourly", "false"));
    auto disabled = reconciler.reconcile("backup");
    EXPECT_TRUE(disabled.changed);
    EXPECT_EQ(registry.size(), baseline);
    EXPECT_EQ(scheduler.size(), baseline);

    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    EXPECT_EQ(registry.size(), baseline + 1);
    EXPECT_EQ(scheduler.size(), baseline + 1);
    EXPECT_EQ(registry.find("backup")->runner->spec().schedule, "@hourly");

    cluster.setService("backup", cronLabels("@hourly", "false"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    EXPECT_EQ(registry.size(), baseline);
    EXPECT_EQ(scheduler.size(), baseline);
}

TEST_F(ReconcilerTest, InvalidScheduleIsAnErrorAndLeavesServiceUnscheduled) {
    cluster.setService("backup", cronLabels("every now and then"));

    auto result = reconciler.reconcile("backup");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.changed);
    EXPECT_NE(result.error.find("invalid schedule"), std::string::npos);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ReconcilerTest, InvalidScheduleOnUpdateDropsOldEntry) {
    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);

    cluster.setService("backup", cronLabels("bogus"));
    auto result = reconciler.reconcile("backup");

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.changed);
    EXPECT_FALSE(registry.find("backup").has_value());
    EXPECT_EQ(scheduler.size(), 0u);
}

TEST_F(ReconcilerTest, ScaledownLeavesExistingEntryUntouched) {
    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    auto before = registry.find("backup");

    Labels labels = cronLabels("@daily");
    labels["swarm.cronjob.scaledown"] = "true";
    cluster.setService("backup", labels);
    auto result = reconciler.reconcile("backup");

    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.changed);
    auto after = registry.find("backup");
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->entry, before->entry);
    EXPECT_EQ(after->runner->spec().schedule, "@hourly");
}

TEST_F(ReconcilerTest, ScaledownCreatesNoEntry) {
    Labels labels = cronLabels("@daily");
    labels["swarm.cronjob.scaledown"] = "true";
    cluster.setService("backup", labels);

    auto result = reconciler.reconcile("backup");

    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.changed);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ReconcilerTest, RemovedServiceDropsEntry) {
    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);

    cluster.removeService("backup");
    auto result = reconciler.reconcile("backup");

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.changed);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(scheduler.size(), 0u);
}

TEST_F(ReconcilerTest, UnknownServiceIsNotAnError) {
    auto result = reconciler.reconcile("ghost");

    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.changed);
}

TEST_F(ReconcilerTest, InspectFailureKeepsEntry) {
    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);

    cluster.failInspect("backup", 500);
    auto result = reconciler.reconcile("backup");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.changed);
    EXPECT_NE(result.error.find("cannot inspect service backup"), std::string::npos);
    EXPECT_TRUE(registry.find("backup").has_value());
}

TEST_F(ReconcilerTest, ReconcileAllRegistersLabelledServices) {
    cluster.setService("a", cronLabels("@hourly"));
    cluster.setService("b", cronLabels("@daily"));
    cluster.setService("c", cronLabels("@daily", "false"));
    cluster.setService("d", Labels{{"swarm.cronjob.enable", "true"}});
    cluster.setService("e", cronLabels("broken"));

    EXPECT_TRUE(reconciler.reconcileAll());

    auto names = registry.names();
    EXPECT_EQ(names, (std::vector<std::string>{"a", "b"}));
}

TEST_F(ReconcilerTest, ConcurrentReconcilesOfDifferentServices) {
    constexpr int kServices = 16;
    for (int i = 0; i < kServices; ++i) {
        cluster.setService("svc" + std::to_string(i), cronLabels("@hourly"));
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < kServices; ++i) {
        threads.emplace_back([this, i] {
            for (int round = 0; round < 10; ++round) {
                (void)reconciler.reconcile("svc" + std::to_string(i));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(registry.size(), static_cast<std::size_t>(kServices));
    EXPECT_EQ(scheduler.size(), static_cast<std::size_t>(kServices));
}

TEST_F(ReconcilerTest, ConcurrentReconcilesOfSameService) {
    cluster.setService("backup", cronLabels("@hourly"));

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this] {
            for (int round = 0; round < 10; ++round) {
                auto result = reconciler.reconcile("backup");
                EXPECT_TRUE(result.ok) << result.error;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(scheduler.size(), 1u);
}

TEST_F(ReconcilerTest, ReconcileDuringEventRunKeepsTheEventSlot) {
    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    auto first = registry.find("backup")->runner;

    ASSERT_TRUE(first->beginEventRun());
    ASSERT_EQ(first->run(RunOrigin::Event).status, RunStatus::Started);

    // The event run's own update comes back as a service event
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    auto second = registry.find("backup")->runner;
    ASSERT_NE(first.get(), second.get());

    EXPECT_EQ(first->state(), second->state());
    EXPECT_TRUE(second->eventRunActive());
    EXPECT_FALSE(second->beginEventRun());
    EXPECT_EQ(second->run(RunOrigin::Schedule).status, RunStatus::Skipped);
    EXPECT_EQ(cluster.updates().size(), 1u);

    first->endEventRun();
    EXPECT_FALSE(second->eventRunActive());
    EXPECT_EQ(second->run(RunOrigin::Schedule).status, RunStatus::Started);
}

TEST_F(ReconcilerTest, RemovedServiceStartsWithFreshRunState) {
    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    ASSERT_TRUE(registry.find("backup")->runner->beginEventRun());

    cluster.setService("backup", cronLabels("@hourly", "false"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    ASSERT_FALSE(registry.find("backup").has_value());

    cluster.setService("backup", cronLabels("@hourly"));
    ASSERT_TRUE(reconciler.reconcile("backup").ok);
    EXPECT_FALSE(registry.find("backup")->runner->eventRunActive());
}
