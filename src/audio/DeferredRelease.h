#pragma once

#include <QtGlobal>
#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

// Keeps objects a real-time thread may still reference alive until that
// thread has completed the cycle it was in when they were retired. Only the
// owning (non real-time) thread touches the list.
template <typename T>
class DeferredRelease {
public:
    void retire(std::shared_ptr<T> object, quint64 completedCycles) {
        if (object)
            m_pending.push_back({std::move(object), completedCycles});
    }

    // Drops every entry retired before the most recent completed cycle.
    void collect(quint64 completedCycles) {
        m_pending.erase(std::remove_if(m_pending.begin(), m_pending.end(),
                                       [completedCycles](const Entry& entry) {
                                           return completedCycles > entry.retiredAt;
                                       }),
                        m_pending.end());
    }

    void clear() { m_pending.clear(); }
    std::size_t size() const noexcept { return m_pending.size(); }

private:
    struct Entry {
        std::shared_ptr<T> object;
        quint64 retiredAt {0};
    };
    std::vector<Entry> m_pending;
};
