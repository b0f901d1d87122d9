/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "swarmcron/scheduler.hpp"

using namespace swarmcron;
using namespace std::chrono_literals;

namespace {

// Counts firings; optionally holds each firing until release() is called.
class CountingJob final : public Schedulable {
public:
    CountingJob(std::string name, bool skip, bool blocking)
        : name_(std::move(name)), skip_(skip), blocking_(blocking) {}

    void trigger() override {
        fired_.fetch_add(1);
        if (!blocking_) {
            return;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        released_.wait(lock, [this] { return release_; });
    }

    std::string name() const override { return name_; }
    bool skipIfRunning() const override { return skip_; }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            release_ = true;
        }
        released_.notify_all();
    }

    int fired() const { return fired_.load(); }

private:
    std::string name_;
    bool skip_;
    bool blocking_;
    std::atomic<int> fired_{0};
    std::mutex mutex_;
    std::condition_variable released_;
    bool release_ = false;
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

}

TEST(SchedulerTest, RejectsInvalidSchedule) {
    Scheduler scheduler(2);
    auto job = std::make_shared<CountingJob>("bad", false, false);

    auto result = scheduler.add("not a cron", job);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("invalid schedule 'not a cron': ", 0), 0u) << result.error;
    EXPECT_EQ(scheduler.size(), 0u);
}

TEST(SchedulerTest, RejectsMissingJob) {
    Scheduler scheduler(2);
    EXPECT_FALSE(scheduler.add("@hourly", nullptr).ok);
}

TEST(SchedulerTest, AddAndRemove) {
    Scheduler scheduler(2);
    auto a = std::make_shared<CountingJob>("a", false, false);
    auto b = std::make_shared<CountingJob>("b", false, false);

    auto first = scheduler.add("@hourly", a);
    auto second = scheduler.add("0 0 * * *", b);
    ASSERT_TRUE(first.ok);
    ASSERT_TRUE(second.ok);
    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(scheduler.size(), 2u);
    EXPECT_EQ(scheduler.job(first.id), a);

    auto next = scheduler.nextRun(first.id);
    ASSERT_TRUE(next.has_value());
    EXPECT_GT(*next, Clock::now());
    EXPECT_LE(*next, Clock::now() + 1h + 1s);

    EXPECT_TRUE(scheduler.remove(first.id));
    EXPECT_FALSE(scheduler.remove(first.id));
    EXPECT_EQ(scheduler.size(), 1u);
    EXPECT_EQ(scheduler.job(first.id), nullptr);
    EXPECT_FALSE(scheduler.nextRun(first.id).has_value());
}

TEST(SchedulerTest, FiresDueEntries) {
    Scheduler scheduler(2);
    auto job = std::make_shared<CountingJob>("tick", false, false);
    ASSERT_TRUE(scheduler.add("@every 1s", job).ok);
    ASSERT_TRUE(scheduler.start());

    EXPECT_TRUE(eventually([&] { return job->fired() >= 2; }, 4s));
    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
}

TEST(SchedulerTest, EntriesAddedWhileRunningAreFired) {
    Scheduler scheduler(2);
    ASSERT_TRUE(scheduler.start());

    auto job = std::make_shared<CountingJob>("late", false, false);
    ASSERT_TRUE(scheduler.add("@every 1s", job).ok);

    EXPECT_TRUE(eventually([&] { return job->fired() >= 1; }, 3s));
    scheduler.stop();
}

TEST(SchedulerTest, RemovedEntriesStopFiring) {
    Scheduler scheduler(2);
    auto job = std::make_shared<CountingJob>("gone", false, false);
    auto added = scheduler.add("@every 1s", job);
    ASSERT_TRUE(added.ok);
    ASSERT_TRUE(scheduler.start());

    ASSERT_TRUE(eventually([&] { return job->fired() >= 1; }, 3s));
    scheduler.remove(added.id);
    int seen = job->fired();
    std::this_thread::sleep_for(2500ms);
    EXPECT_EQ(job->fired(), seen);
    scheduler.stop();
}

TEST(SchedulerTest, SkipIfRunningDropsOverlappingFirings) {
    Scheduler scheduler(4);
    auto job = std::make_shared<CountingJob>("slow", true, true);
    ASSERT_TRUE(scheduler.add("@every 1s", job).ok);
    ASSERT_TRUE(scheduler.start());

    ASSERT_TRUE(eventually([&] { return job->fired() >= 1; }, 3s));
    std::this_thread::sleep_for(2500ms);
    EXPECT_EQ(job->fired(), 1);

    job->release();
    scheduler.stop();
}

TEST(SchedulerTest, OverlappingFiringsAllowedWithoutSkip) {
    Scheduler scheduler(4);
    auto job = std::make_shared<CountingJob>("slow", false, true);
    ASSERT_TRUE(scheduler.add("@every 1s", job).ok);
    ASSERT_TRUE(scheduler.start());

    EXPECT_TRUE(eventually([&] { return job->fired() >= 2; }, 4s));

    job->release();
    scheduler.stop();
}

TEST(SchedulerTest, StartTwiceFails) {
    Scheduler scheduler(1);
    ASSERT_TRUE(scheduler.start());
    EXPECT_FALSE(scheduler.start());
    scheduler.stop();
}
