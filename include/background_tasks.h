#pragma once
#ifndef BACKGROUND_TASKS_H
#define BACKGROUND_TASKS_H

#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <vector>

/**
 * Keep-alive sink for detached cache work.
 *
 * Cache::get() launches revalidation on a detached thread and never waits for
 * it. Environments that tear down idle work (or tests that need to observe the
 * result) register this sink through CacheOptions::keep_alive and call
 * wait_all() when they need the work finished.
 *
 * The sink must outlive every cache that was given its hook(). The destructor
 * drains outstanding tasks.
 */
class BackgroundTasks {
public:
    BackgroundTasks() = default;
    ~BackgroundTasks();

    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;

    /// Callback suitable for CacheOptions::keep_alive.
    std::function<void(std::future<void>)> hook();

    /// Take ownership of a task's completion future.
    void track(std::future<void> task);

    /**
     * Block until every tracked task has finished, including tasks tracked
     * while waiting.
     * @return Number of tasks waited for
     */
    size_t wait_all();

    /// Tasks tracked but not finished yet.
    size_t pending() const;

private:
    mutable std::mutex mutex_;              ///< Protects tasks_
    std::vector<std::future<void>> tasks_;  ///< Completion futures, oldest first
};

#endif // BACKGROUND_TASKS_H
