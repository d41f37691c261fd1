#pragma once

#include "config.hpp"
#include "object_pool.hpp"
#include "state_types.hpp"
#include "transition_collector.hpp"
#include "update_queue.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace reconciler {

using container_ptr = std::shared_ptr<const state_container>;
using container_map = std::unordered_map<state_key, container_ptr>;
using key_set = std::unordered_set<state_key>;

// Pools shared by every store of one tree. Owned by whoever builds the stores
// (normally the commit_coordinator) and injected at construction.
struct store_pools {
    explicit store_pools(const engine_config& cfg)
        : update_lists(cfg.pool_capacity, cfg.initial_update_list_capacity),
          pending_maps(cfg.pool_capacity, cfg.initial_map_capacity),
          container_maps(cfg.pool_capacity, cfg.initial_map_capacity)
    {}

    object_pool<update_list> update_lists;
    object_pool<queue_map> pending_maps;
    object_pool<container_map> container_maps;
};

// What a finished build hands over to the committed store.
struct generation_result {
    keyed_updates applied;   // inherited records that were applied
    keyed_updates deferred;  // records enqueued on the working store, not applied
    std::unique_ptr<container_map> containers;
    std::optional<key_set> needed;  // nullopt if no build ran and nothing was materialized
    std::vector<transition> transitions;
};

// Holds the state containers, pending updates and needed keys of one
// generation of a tree.
//
// Every accessor takes the store's lock for a single short step; the lock is
// never held while updates run or while the tree is being built.
class state_store {
public:
    using initial_state_fn = std::function<std::unique_ptr<state_container>()>;

    state_store(std::shared_ptr<store_pools> pools,
                std::shared_ptr<spdlog::logger> log,
                uint64_t generation = 0,
                uint64_t base_generation = 0);
    ~state_store();

    state_store(const state_store&) = delete;
    state_store& operator=(const state_store&) = delete;

    // Copy containers (by reference) and pending updates (list copies) from
    // the previous committed store. No-op if from is null.
    void seed(const state_store* from);

    // Starts tracking needed keys. After this, keys the build does not visit
    // are dropped at commit, even if it visits none at all.
    void begin_build();

    // Marks key as needed and returns its carried-forward container, or null
    // if the key has no prior state.
    container_ptr materialize(const state_key& key);

    // Applies the key's pending updates to container in enqueue order and
    // stores the result as the key's container. Throws std::invalid_argument
    // if container is null.
    container_ptr apply_updates_for(const state_key& key,
                                    std::unique_ptr<state_container> container);

    // materialize, then clone the carried container or create_initial(),
    // then apply_updates_for.
    container_ptr reconcile(const state_key& key, const initial_state_fn& create_initial);

    // Any thread. Throws std::invalid_argument if update is null.
    void enqueue(const state_key& key, state_update_ptr update);

    bool is_empty() const;

    // One-shot: transitions collected so far, then the buffer is cleared.
    std::vector<transition> get_transitions();

    container_ptr find(const state_key& key) const;
    std::size_t container_count() const;
    std::size_t pending_count(const state_key& key) const;
    std::size_t pending_key_count() const;
    bool is_needed(const state_key& key) const;

    uint64_t generation() const { return m_generation; }
    uint64_t base_generation() const { return m_base_generation; }

    // Return the internal maps to the pools. The store is empty afterwards.
    void release();

    // Commit support, used by commit_coordinator.

    // Moves out everything the committed store needs. Called once, after the
    // build has finished.
    generation_result take_result();

    // See pending_updates::drain_applied.
    std::size_t drain_applied(const state_key& key, const update_list& applied);

    // Drops containers whose key is not in needed (when given), then replaces
    // the container map wholesale. Returns the number of containers dropped.
    std::size_t replace_containers(std::unique_ptr<container_map> containers,
                                   const std::optional<key_set>& needed);

    void merge_pending(const keyed_updates& deferred);

    void add_transitions(std::vector<transition> transitions);

private:
    // Lazily acquired from the pool. m_mutex must be held.
    container_map& containers();

    std::shared_ptr<store_pools> m_pools;
    std::shared_ptr<spdlog::logger> m_log;
    const uint64_t m_generation;
    const uint64_t m_base_generation;

    mutable std::mutex m_mutex;

    // Protected by m_mutex
    std::unique_ptr<container_map> m_containers;
    pending_updates m_pending;
    key_set m_needed;
    bool m_tracking_needed = false;
    transition_collector m_transitions;
};

} // namespace reconciler
