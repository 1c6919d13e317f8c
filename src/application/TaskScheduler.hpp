/**
 * @file TaskScheduler.hpp
 * @brief Single background thread running delayed tasks that can be cancelled.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace runrelay::application {

/** @brief Identifies a scheduled task. kInvalidTask never names one. */
using TaskHandle = std::uint64_t;
constexpr TaskHandle kInvalidTask = 0;

/**
 * @class TaskScheduler
 * @brief Runs tasks one at a time, in due-time order, on its own worker thread.
 *
 * A cancelled task never starts. A task that has already started runs to
 * completion; callers re-check their own state inside the task.
 */
class TaskScheduler {
public:
    using Clock = std::chrono::steady_clock;

    TaskScheduler();
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    /**
     * @brief Schedules a task to run after the given delay.
     * @return Handle for cancel(), or kInvalidTask once the scheduler is stopped.
     */
    TaskHandle schedule(std::chrono::milliseconds delay, std::function<void()> task);

    /** @brief Removes a pending task. Returns false if it already ran or never existed. */
    bool cancel(TaskHandle handle);

    /**
     * @brief Drops pending tasks and joins the worker. Safe to call more than once.
     *
     * Must not be called from a scheduled task: the worker cannot join itself.
     */
    void stop();

    std::size_t pendingCount() const;

private:
    using Key = std::pair<Clock::time_point, TaskHandle>;

    void workerLoop();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<Key, std::function<void()>> m_tasks;
    std::unordered_map<TaskHandle, Clock::time_point> m_index;
    TaskHandle m_nextHandle = 1;
    bool m_running = true;
    std::thread m_worker;
};

} // namespace runrelay::application
