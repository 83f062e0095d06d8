#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

// Bounded multi-producer queue drained by the UI thread. Producers never
// wait for space: a push into a full channel is dropped and counted.
template <typename T>
class MessageChannel {
public:
    explicit MessageChannel(std::size_t capacity)
        : m_capacity(capacity > 0 ? capacity : 1) {}

    bool tryPush(T value) {
        std::lock_guard<std::mutex> guard(m_mutex);
        if (m_pending.size() >= m_capacity) {
            ++m_dropped;
            return false;
        }
        m_pending.emplace_back(std::move(value));
        return true;
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> guard(m_mutex);
        std::vector<T> out;
        out.reserve(m_pending.size());
        for (auto& value : m_pending)
            out.emplace_back(std::move(value));
        m_pending.clear();
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> guard(m_mutex);
        return m_pending.size();
    }

    std::size_t dropped() const {
        std::lock_guard<std::mutex> guard(m_mutex);
        return m_dropped;
    }

    std::size_t capacity() const noexcept { return m_capacity; }

private:
    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::deque<T> m_pending;
    std::size_t m_dropped {0};
};
