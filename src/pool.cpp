/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/pool.hpp"
#include "swarmcron/logger.hpp"
#include <system_error>

namespace swarmcron {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    // Signal shutdown
    shutdown_.store(true);
    running_.store(false);

    // Wake up all waiting threads
    taskAvailable_.notify_all();

    // Wait for in-flight tasks to finish
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = taskQueue_.size();
        while (!taskQueue_.empty()) {
            taskQueue_.pop();
        }
    }
    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " queued task(s) dropped");
    }

    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(PoolTask task) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit task to stopped pool: " + task.name);
        return false;
    }

    const std::string name = task.name;
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            taskQueue_.push(std::move(task));
        }

        taskAvailable_.notify_one();
        LOG_TRACE("Task queued: " + name);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue task: " + name + ": " + std::string(e.what()));
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return taskQueue_.size();
    } catch (const std::system_error&) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName("Worker-" + std::to_string(workerId));
    LOG_TRACE("Worker-" + std::to_string(workerId) + " thread started");

    try {
        while (!shutdown_.load()) {
            PoolTask task;

            {
                std::unique_lock<std::mutex> lock(queueMutex_);

                // Wait for a task or shutdown signal
                taskAvailable_.wait(lock, [this] {
                    return !taskQueue_.empty() || shutdown_.load();
                });

                if (shutdown_.load()) {
                    break;
                }

                if (taskQueue_.empty()) {
                    continue;
                }

                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }

            // Run outside of lock
            if (task.work) {
                try {
                    task.work();
                } catch (const std::exception& e) {
                    LOG_ERROR("Worker " + std::to_string(workerId) + " task error: " +
                             std::string(e.what()) + " (task: " + task.name + ")");
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker " + std::to_string(workerId) + " fatal error: " + std::string(e.what()));
    }

    LOG_TRACE("Worker " + std::to_string(workerId) + " stopped");
}

}
