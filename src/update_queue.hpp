#pragma once

#include "object_pool.hpp"
#include "state_types.hpp"
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace reconciler {

using update_list = std::vector<state_update_ptr>;

// FIFO of pending updates for one key.
struct update_queue {
    std::unique_ptr<update_list> records;
    std::size_t inherited = 0;  // records copied in at the checkpoint
    std::size_t applied = 0;    // records applied by the current generation
};

using queue_map = std::unordered_map<state_key, update_queue>;

using keyed_updates = std::vector<std::pair<state_key, update_list>>;

// Per-key pending state updates. Not synchronized; the owning state_store
// guards every call with its lock.
class pending_updates {
public:
    pending_updates(object_pool<update_list>& lists, object_pool<queue_map>& maps);
    ~pending_updates();

    pending_updates(const pending_updates&) = delete;
    pending_updates& operator=(const pending_updates&) = delete;

    // Append to the key's queue, creating it if absent.
    void enqueue(const state_key& key, state_update_ptr update);

    // Checkpoint: copy every queue of other (pointer copy of the records).
    void seed_from(const pending_updates& other);

    // Copy of the key's queue as it is right now. Empty if there is none.
    update_list snapshot(const state_key& key) const;

    void mark_applied(const state_key& key, std::size_t count);

    // Remove the prefix of the key's queue matching applied (by identity).
    // Records appended after the checkpoint survive. An emptied queue is
    // removed and its list recycled. Returns how many records were removed.
    std::size_t drain_applied(const state_key& key, const update_list& applied);

    // Inherited records applied by this generation, per key.
    keyed_updates applied_prefixes() const;

    // Records enqueued here after the checkpoint and not applied, per key.
    keyed_updates deferred() const;

    std::size_t size(const state_key& key) const;
    std::size_t key_count() const;
    bool empty() const;

    // Recycle every list and the map itself.
    void clear();

private:
    queue_map& queues();

    object_pool<update_list>& m_lists;
    object_pool<queue_map>& m_maps;

    // Acquired lazily from m_maps
    std::unique_ptr<queue_map> m_queues;
};

} // namespace reconciler
