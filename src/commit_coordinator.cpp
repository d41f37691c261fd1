#include "commit_coordinator.hpp"
#include <stdexcept>
#include <utility>

namespace reconciler {

commit_coordinator::commit_coordinator(const engine_config& cfg,
                                       std::shared_ptr<spdlog::logger> log)
    : commit_coordinator(std::make_shared<store_pools>(cfg), std::move(log))
{}

commit_coordinator::commit_coordinator(std::shared_ptr<store_pools> pools,
                                       std::shared_ptr<spdlog::logger> log)
    : m_pools(std::move(pools)), m_log(std::move(log)),
      m_committed(m_pools, m_log)
{}

void commit_coordinator::enqueue(const state_key& key, state_update_ptr update) {
    m_committed.enqueue(key, std::move(update));
}

std::unique_ptr<state_store> commit_coordinator::begin_generation() {
    std::lock_guard<std::mutex> lock(m_order_mutex);

    uint64_t base = m_generation.load(std::memory_order_relaxed);
    auto working = std::make_unique<state_store>(m_pools, m_log, base + 1, base);
    working->seed(&m_committed);
    return working;
}

bool commit_coordinator::commit(std::unique_ptr<state_store> working) {
    if (!working) {
        throw std::invalid_argument("commit_coordinator: null working store");
    }

    std::lock_guard<std::mutex> lock(m_order_mutex);

    uint64_t current = m_generation.load(std::memory_order_relaxed);
    if (working->base_generation() != current) {
        m_stale.fetch_add(1, std::memory_order_relaxed);
        m_log->warn("Discarding stale generation {} (based on {}, committed is {})",
                   working->generation(), working->base_generation(), current);
        return false;
    }

    auto result = working->take_result();

    // 1. Remove what this generation applied from the authoritative queues
    uint64_t drained = 0;
    for (const auto& [key, applied] : result.applied) {
        std::size_t removed = m_committed.drain_applied(key, applied);
        if (removed != applied.size()) {
            m_log->warn("generation {}: drained {} of {} applied updates for '{}'",
                       working->generation(), removed, applied.size(), key);
        }
        drained += removed;
    }

    // 2+3. Drop state of keys that disappeared, take the working containers
    std::size_t collected = m_committed.replace_containers(
        std::move(result.containers), result.needed);

    // 4. Updates queued on the working store itself go to the next generation
    m_committed.merge_pending(result.deferred);

    m_committed.add_transitions(std::move(result.transitions));

    // 5. Retire the working store; its lists and maps go back to the pools
    uint64_t generation = working->generation();
    working.reset();

    m_generation.store(generation, std::memory_order_release);
    m_commits.fetch_add(1, std::memory_order_relaxed);
    m_updates_drained.fetch_add(drained, std::memory_order_relaxed);
    m_containers_collected.fetch_add(collected, std::memory_order_relaxed);

    m_log->debug("Committed generation {}: drained={} collected={} containers={}",
                generation, drained, collected, m_committed.container_count());
    return true;
}

void commit_coordinator::discard(std::unique_ptr<state_store> working) {
    if (!working) return;

    m_discards.fetch_add(1, std::memory_order_relaxed);
    m_log->debug("Discarded generation {}", working->generation());
}

bool commit_coordinator::is_empty() const {
    return m_committed.is_empty();
}

std::vector<transition> commit_coordinator::consume_transitions() {
    return m_committed.get_transitions();
}

commit_coordinator::stats commit_coordinator::get_stats() const {
    auto lists = m_pools->update_lists.get_stats();
    auto pending = m_pools->pending_maps.get_stats();
    auto maps = m_pools->container_maps.get_stats();

    return {
        generation(),
        m_commits.load(std::memory_order_relaxed),
        m_discards.load(std::memory_order_relaxed),
        m_stale.load(std::memory_order_relaxed),
        m_updates_drained.load(std::memory_order_relaxed),
        m_containers_collected.load(std::memory_order_relaxed),
        m_committed.container_count(),
        m_committed.pending_key_count(),
        lists.hits + pending.hits + maps.hits,
        lists.misses + pending.misses + maps.misses
    };
}

} // namespace reconciler
