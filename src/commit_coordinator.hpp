#pragma once

#include "config.hpp"
#include "state_store.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace reconciler {

// Owns the committed store of one tree and runs the seed/commit protocol
// against working stores built from it.
//
// Producers call enqueue() from any thread. begin_generation() and commit()
// are serialized on a single ordering mutex; enqueue() never takes it.
class commit_coordinator {
public:
    struct stats {
        uint64_t generation = 0;
        uint64_t commits = 0;
        uint64_t discards = 0;
        uint64_t stale = 0;
        uint64_t updates_drained = 0;
        uint64_t containers_collected = 0;
        std::size_t containers = 0;
        std::size_t pending_keys = 0;
        uint64_t pool_hits = 0;
        uint64_t pool_misses = 0;
    };

    commit_coordinator(const engine_config& cfg, std::shared_ptr<spdlog::logger> log);

    // Injects the pools, e.g. to share them between trees.
    commit_coordinator(std::shared_ptr<store_pools> pools, std::shared_ptr<spdlog::logger> log);

    commit_coordinator(const commit_coordinator&) = delete;
    commit_coordinator& operator=(const commit_coordinator&) = delete;

    // Queue a state update for the next generation. Any thread.
    void enqueue(const state_key& key, state_update_ptr update);

    // New working store seeded from the committed store (the checkpoint).
    std::unique_ptr<state_store> begin_generation();

    // Reconcile working into the committed store. Returns false (and discards
    // working) if another generation was committed since working was seeded.
    bool commit(std::unique_ptr<state_store> working);

    // Drop a working store without any effect on the committed store.
    void discard(std::unique_ptr<state_store> working);

    bool is_empty() const;

    // Transitions of all committed generations not yet consumed. One-shot.
    std::vector<transition> consume_transitions();

    const state_store& committed() const { return m_committed; }

    uint64_t generation() const { return m_generation.load(std::memory_order_acquire); }

    stats get_stats() const;

    const std::shared_ptr<store_pools>& pools() const { return m_pools; }

private:
    std::shared_ptr<store_pools> m_pools;
    std::shared_ptr<spdlog::logger> m_log;

    // Orders begin_generation() against commit()
    std::mutex m_order_mutex;

    state_store m_committed;
    std::atomic<uint64_t> m_generation{0};

    std::atomic<uint64_t> m_commits{0};
    std::atomic<uint64_t> m_discards{0};
    std::atomic<uint64_t> m_stale{0};
    std::atomic<uint64_t> m_updates_drained{0};
    std::atomic<uint64_t> m_containers_collected{0};
};

} // namespace reconciler
