/**
 * @file EventBuffer.cpp
 * @brief Implementation of EventBuffer.
 */

#include "application/EventBuffer.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>

namespace runrelay::application {

EventBuffer::EventBuffer(std::size_t capacity, bool debug)
    : m_capacity(std::max<std::size_t>(capacity, 1)), m_debug(debug) {}

void EventBuffer::enqueue(domain::EventRecord record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.size() >= m_capacity) {
        std::cerr << "[EventBuffer] Buffer full (" << m_capacity
                  << "), dropped oldest event: " << m_queue.front().kind() << std::endl;
        m_queue.pop_front();
        ++m_dropped;
    }
    m_queue.push_back(std::move(record));
    if (m_debug) {
        std::cout << "[EventBuffer] Enqueued " << m_queue.back().kind()
                  << ", size " << m_queue.size() << std::endl;
    }
}

std::vector<domain::EventRecord> EventBuffer::drain() {
    std::vector<domain::EventRecord> records;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        records.reserve(m_queue.size());
        std::move(m_queue.begin(), m_queue.end(), std::back_inserter(records));
        m_queue.clear();
    }
    if (m_debug && !records.empty()) {
        std::cout << "[EventBuffer] Drained " << records.size() << " events" << std::endl;
    }
    return records;
}

void EventBuffer::clear() {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        count = m_queue.size();
        m_queue.clear();
    }
    if (m_debug) {
        std::cout << "[EventBuffer] Cleared " << count << " events" << std::endl;
    }
}

std::size_t EventBuffer::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool EventBuffer::isEmpty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.empty();
}

std::size_t EventBuffer::droppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

} // namespace runrelay::application
