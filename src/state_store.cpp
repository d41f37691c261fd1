#include "state_store.hpp"
#include <stdexcept>
#include <utility>

namespace reconciler {

state_store::state_store(std::shared_ptr<store_pools> pools,
                         std::shared_ptr<spdlog::logger> log,
                         uint64_t generation,
                         uint64_t base_generation)
    : m_pools(std::move(pools)), m_log(std::move(log)),
      m_generation(generation), m_base_generation(base_generation),
      m_pending(m_pools->update_lists, m_pools->pending_maps)
{}

state_store::~state_store() {
    release();
}

container_map& state_store::containers() {
    if (!m_containers) m_containers = m_pools->container_maps.acquire();
    return *m_containers;
}

void state_store::seed(const state_store* from) {
    if (!from || from == this) return;

    std::scoped_lock lock(m_mutex, from->m_mutex);

    m_pending.seed_from(from->m_pending);

    if (from->m_containers && !from->m_containers->empty()) {
        auto& mine = containers();
        mine.clear();
        mine.insert(from->m_containers->begin(), from->m_containers->end());
    }

    m_log->debug("generation {}: seeded {} containers, {} pending keys",
                m_generation,
                m_containers ? m_containers->size() : 0,
                m_pending.key_count());
}

void state_store::begin_build() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tracking_needed = true;
}

container_ptr state_store::materialize(const state_key& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_tracking_needed = true;
    m_needed.insert(key);

    if (!m_containers) return nullptr;
    auto it = m_containers->find(key);
    if (it == m_containers->end()) return nullptr;
    return it->second;
}

container_ptr state_store::apply_updates_for(const state_key& key,
                                             std::unique_ptr<state_container> container) {
    if (!container) {
        throw std::invalid_argument("state_store: null container for key '" + key + "'");
    }

    update_list updates;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        updates = m_pending.snapshot(key);
    }

    // Runs unlocked; producers may keep enqueueing meanwhile.
    const update_context ctx{key, m_generation};
    for (const auto& update : updates) {
        update->apply(*container, ctx);
    }

    std::vector<transition> emitted;
    if (container->has_transitions()) {
        emitted = container->consume_transitions();
    }

    container_ptr stored(std::move(container));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!updates.empty()) {
        m_pending.mark_applied(key, updates.size());
        m_log->trace("generation {}: applied {} updates to '{}'",
                    m_generation, updates.size(), key);
    }
    if (!emitted.empty()) {
        m_transitions.add(key, std::move(emitted));
    }
    m_tracking_needed = true;
    m_needed.insert(key);
    containers()[key] = stored;
    return stored;
}

container_ptr state_store::reconcile(const state_key& key,
                                     const initial_state_fn& create_initial) {
    auto basis = materialize(key);

    std::unique_ptr<state_container> working;
    if (basis) {
        working = basis->clone();
    } else if (create_initial) {
        working = create_initial();
    }

    if (!working) {
        throw std::invalid_argument("state_store: no state for key '" + key + "'");
    }

    return apply_updates_for(key, std::move(working));
}

void state_store::enqueue(const state_key& key, state_update_ptr update) {
    if (!update) {
        throw std::invalid_argument("state_store: null update for key '" + key + "'");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.enqueue(key, std::move(update));
}

bool state_store::is_empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_containers || m_containers->empty();
}

std::vector<transition> state_store::get_transitions() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transitions.consume();
}

container_ptr state_store::find(const state_key& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_containers) return nullptr;
    auto it = m_containers->find(key);
    if (it == m_containers->end()) return nullptr;
    return it->second;
}

std::size_t state_store::container_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_containers ? m_containers->size() : 0;
}

std::size_t state_store::pending_count(const state_key& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size(key);
}

std::size_t state_store::pending_key_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.key_count();
}

bool state_store::is_needed(const state_key& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_needed.count(key) > 0;
}

void state_store::release() {
    std::unique_ptr<container_map> retired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.clear();
        retired = std::move(m_containers);
        m_needed.clear();
        m_tracking_needed = false;
        m_transitions.consume();
    }
    // Dropping the last reference to a container may run arbitrary destructors
    m_pools->container_maps.release(std::move(retired));
}

generation_result state_store::take_result() {
    std::lock_guard<std::mutex> lock(m_mutex);

    generation_result result;
    result.applied = m_pending.applied_prefixes();
    result.deferred = m_pending.deferred();
    result.containers = std::move(m_containers);
    if (m_tracking_needed) {
        result.needed = std::move(m_needed);
        m_needed.clear();
        m_tracking_needed = false;
    }
    result.transitions = m_transitions.consume();
    return result;
}

std::size_t state_store::drain_applied(const state_key& key, const update_list& applied) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.drain_applied(key, applied);
}

std::size_t state_store::replace_containers(std::unique_ptr<container_map> incoming,
                                            const std::optional<key_set>& needed) {
    std::size_t collected = 0;
    std::unique_ptr<container_map> retired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (needed) {
            if (m_containers) {
                for (const auto& [key, container] : *m_containers) {
                    if (!needed->count(key)) ++collected;
                }
            }
            // Seeded entries whose key was not visited this generation
            if (incoming) {
                for (auto it = incoming->begin(); it != incoming->end();) {
                    if (needed->count(it->first)) {
                        ++it;
                    } else {
                        it = incoming->erase(it);
                    }
                }
            }
        }

        retired = std::move(m_containers);
        m_containers = std::move(incoming);
    }

    m_pools->container_maps.release(std::move(retired));
    return collected;
}

void state_store::merge_pending(const keyed_updates& deferred) {
    if (deferred.empty()) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [key, records] : deferred) {
        for (const auto& update : records) {
            m_pending.enqueue(key, update);
        }
    }
}

void state_store::add_transitions(std::vector<transition> transitions) {
    if (transitions.empty()) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_transitions.append(std::move(transitions));
}

} // namespace reconciler
