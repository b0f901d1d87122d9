/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/scheduler.hpp"
#include "swarmcron/logger.hpp"

namespace swarmcron {

namespace {

// Clears the in-flight marker of an entry when the firing ends, however it ends.
class InFlightGuard {
public:
    explicit InFlightGuard(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}
    ~InFlightGuard() { flag_->store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}

Scheduler::Scheduler(int workers) : pool_(workers) {
}

Scheduler::~Scheduler() {
    stop();
}

AddResult Scheduler::add(const std::string& schedule, std::shared_ptr<Schedulable> job) {
    AddResult result;
    if (!job) {
        result.error = "no job given for schedule " + schedule;
        return result;
    }

    auto parsed = CronSchedule::parse(schedule);
    if (!parsed) {
        result.error = "invalid schedule '" + schedule + "': " + parsed.error;
        return result;
    }

    Entry entry;
    entry.schedule = parsed.schedule;
    entry.job = std::move(job);
    entry.next = entry.schedule.next(Clock::now());
    entry.inFlight = std::make_shared<std::atomic<bool>>(false);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.id = nextId_++;
        result.id = entry.id;
        entries_.emplace(entry.id, std::move(entry));
        ++generation_;
    }
    changed_.notify_all();

    result.ok = true;
    return result;
}

bool Scheduler::remove(EntryId id) noexcept {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = entries_.erase(id) > 0;
        ++generation_;
    }
    changed_.notify_all();
    return removed;
}

std::size_t Scheduler::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::optional<Clock::time_point> Scheduler::nextRun(EntryId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.next;
}

std::shared_ptr<Schedulable> Scheduler::job(EntryId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.job;
}

bool Scheduler::start() {
    if (running_.load()) {
        LOG_WARN("Scheduler already running");
        return false;
    }

    if (!pool_.start()) {
        LOG_ERROR("Failed to start scheduler worker pool");
        return false;
    }

    shutdown_.store(false);
    running_.store(true);
    try {
        loopThread_ = std::thread(&Scheduler::loop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start scheduler loop: " + std::string(e.what()));
        running_.store(false);
        pool_.stop();
        return false;
    }

    LOG_DEBUG("Scheduler started with " + std::to_string(size()) + " entries");
    return true;
}

void Scheduler::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping scheduler...");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    changed_.notify_all();

    if (loopThread_.joinable()) {
        loopThread_.join();
    }

    // In-flight firings are allowed to finish
    pool_.stop();
    LOG_DEBUG("Scheduler stopped");
}

void Scheduler::loop() {
    setThreadName("Scheduler");
    LOG_DEBUG("Scheduler loop started");

    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_.load()) {
        try {
            auto now = Clock::now();

            std::optional<Clock::time_point> earliest;
            for (const auto& [id, entry] : entries_) {
                if (entry.next && (!earliest || *entry.next < *earliest)) {
                    earliest = entry.next;
                }
            }

            const auto seen = generation_;
            auto woken = [this, seen] { return shutdown_.load() || generation_ != seen; };

            if (!earliest) {
                changed_.wait(lock, woken);
                continue;
            }
            if (*earliest > now) {
                changed_.wait_until(lock, *earliest, woken);
                continue;
            }

            for (auto& [id, entry] : entries_) {
                if (!entry.next || *entry.next > now) {
                    continue;
                }
                fire(entry);
                entry.next = entry.schedule.next(now);
                if (!entry.next) {
                    LOG_WARN("Schedule '" + entry.schedule.expression() + "' of " + entry.job->name() +
                             " has no further activation");
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler loop error: " + std::string(e.what()));
        }
    }

    LOG_DEBUG("Scheduler loop stopped");
}

void Scheduler::fire(Entry& entry) {
    auto job = entry.job;
    auto inFlight = entry.inFlight;

    bool expected = false;
    if (!inFlight->compare_exchange_strong(expected, true)) {
        if (job->skipIfRunning()) {
            LOG_INFO("Skip " + job->name() + ": previous firing still in progress");
            return;
        }
    }

    // Only the firing that set the marker clears it
    const bool owner = !expected;
    bool queued = pool_.submit({job->name(), [job, inFlight, owner] {
        std::optional<InFlightGuard> guard;
        if (owner) {
            guard.emplace(inFlight);
        }
        job->trigger();
    }});

    if (!queued && owner) {
        inFlight->store(false);
    }
}

}
