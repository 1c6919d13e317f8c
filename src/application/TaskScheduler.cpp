/**
 * @file TaskScheduler.cpp
 * @brief Implementation of TaskScheduler.
 */

#include "application/TaskScheduler.hpp"
#include <exception>
#include <iostream>

namespace runrelay::application {

TaskScheduler::TaskScheduler() {
    m_worker = std::thread(&TaskScheduler::workerLoop, this);
}

TaskScheduler::~TaskScheduler() {
    stop();
}

TaskHandle TaskScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    TaskHandle handle = kInvalidTask;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return kInvalidTask;
        }
        handle = m_nextHandle++;
        auto due = Clock::now() + delay;
        m_tasks.emplace(Key{due, handle}, std::move(task));
        m_index.emplace(handle, due);
    }
    m_cv.notify_one();
    return handle;
}

bool TaskScheduler::cancel(TaskHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(handle);
    if (it == m_index.end()) {
        return false;
    }
    m_tasks.erase(Key{it->second, handle});
    m_index.erase(it);
    return true;
}

void TaskScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
        m_tasks.clear();
        m_index.clear();
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::size_t TaskScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void TaskScheduler::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_tasks.empty() || !m_running; });
            if (!m_running) {
                return;
            }

            auto due = m_tasks.begin()->first.first;
            if (Clock::now() < due) {
                // Woken early or a sooner task may arrive; re-evaluate.
                m_cv.wait_until(lock, due);
                continue;
            }

            auto first = m_tasks.begin();
            task = std::move(first->second);
            m_index.erase(first->first.second);
            m_tasks.erase(first);
        }

        // Run outside the lock so tasks may schedule or cancel.
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[TaskScheduler] Task failed: " << e.what() << std::endl;
        }
    }
}

} // namespace runrelay::application
