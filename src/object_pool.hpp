#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace reconciler {

// Recycles heap-allocated containers (vectors, maps) to keep allocation
// pressure flat under high rebuild frequency. Transparent: a pool of capacity
// zero behaves exactly like plain allocation.
//
// T must provide clear() and reserve(size_t).
template <typename T>
class object_pool {
public:
    struct stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t dropped = 0;
        std::size_t idle = 0;
    };

    object_pool(std::size_t capacity, std::size_t initial_reserve)
        : m_capacity(capacity), m_initial_reserve(initial_reserve)
    {
        m_free.reserve(capacity);
    }

    object_pool(const object_pool&) = delete;
    object_pool& operator=(const object_pool&) = delete;

    std::unique_ptr<T> acquire() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_free.empty()) {
                auto obj = std::move(m_free.back());
                m_free.pop_back();
                m_hits.fetch_add(1, std::memory_order_relaxed);
                return obj;
            }
        }

        m_misses.fetch_add(1, std::memory_order_relaxed);
        auto obj = std::make_unique<T>();
        if (m_initial_reserve > 0) obj->reserve(m_initial_reserve);
        return obj;
    }

    // Clears obj and keeps it for reuse if there is room; otherwise it is
    // destroyed here.
    void release(std::unique_ptr<T> obj) {
        if (!obj) return;
        obj->clear();

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_free.size() < m_capacity) {
            m_free.push_back(std::move(obj));
        } else {
            m_dropped.fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::size_t capacity() const { return m_capacity; }

    std::size_t idle() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_free.size();
    }

    stats get_stats() const {
        return {
            m_hits.load(std::memory_order_relaxed),
            m_misses.load(std::memory_order_relaxed),
            m_dropped.load(std::memory_order_relaxed),
            idle()
        };
    }

private:
    const std::size_t m_capacity;
    const std::size_t m_initial_reserve;

    mutable std::mutex m_mutex;
    std::vector<std::unique_ptr<T>> m_free;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_misses{0};
    std::atomic<uint64_t> m_dropped{0};
};

} // namespace reconciler
