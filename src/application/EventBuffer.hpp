/**
 * @file EventBuffer.hpp
 * @brief Bounded FIFO of event records waiting for a live connection.
 */

#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>
#include "domain/EventRecord.hpp"

namespace runrelay::application {

/**
 * @class EventBuffer
 * @brief Thread-safe, capacity-bounded queue that evicts its oldest record when full.
 *
 * size() never exceeds capacity(). Records come out of drain() in the order
 * they went in, minus whatever eviction removed from the front.
 */
class EventBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit EventBuffer(std::size_t capacity = kDefaultCapacity, bool debug = false);

    /** @brief Appends a record, evicting the oldest one first when at capacity. */
    void enqueue(domain::EventRecord record);

    /** @brief Removes and returns every buffered record in FIFO order. */
    std::vector<domain::EventRecord> drain();

    /** @brief Discards all buffered records. */
    void clear();

    std::size_t size() const;
    bool isEmpty() const;
    std::size_t capacity() const { return m_capacity; }

    /** @brief Number of records lost to eviction since construction. */
    std::size_t droppedCount() const;

private:
    const std::size_t m_capacity;
    const bool m_debug;

    mutable std::mutex m_mutex;
    std::deque<domain::EventRecord> m_queue;
    std::size_t m_dropped = 0;
};

} // namespace runrelay::application
