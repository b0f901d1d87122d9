/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "swarmcron/cron.hpp"
#include "swarmcron/pool.hpp"

namespace swarmcron {

// Unit of work the scheduler knows how to fire.
class Schedulable {
public:
    virtual ~Schedulable() = default;
    virtual void trigger() = 0;
    [[nodiscard]] virtual std::string name() const = 0;
    // When true a firing is dropped while the previous one is still in progress
    [[nodiscard]] virtual bool skipIfRunning() const = 0;
};

using EntryId = std::uint64_t;

struct AddResult {
    bool ok = false;
    EntryId id = 0;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

class Scheduler final {
public:
    explicit Scheduler(int workers = 8);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    [[nodiscard]] AddResult add(const std::string& schedule, std::shared_ptr<Schedulable> job);
    bool remove(EntryId id) noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::optional<Clock::time_point> nextRun(EntryId id) const;
    [[nodiscard]] std::shared_ptr<Schedulable> job(EntryId id) const;

    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    struct Entry {
        EntryId id = 0;
        CronSchedule schedule;
        std::shared_ptr<Schedulable> job;
        std::optional<Clock::time_point> next;
        std::shared_ptr<std::atomic<bool>> inFlight;
    };

    void loop();
    void fire(Entry& entry);

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::map<EntryId, Entry> entries_;
    EntryId nextId_ = 1;
    std::uint64_t generation_ = 0;

    Pool pool_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread loopThread_;
};

}
