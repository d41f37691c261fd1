#include "update_queue.hpp"
#include <algorithm>

namespace reconciler {

pending_updates::pending_updates(object_pool<update_list>& lists,
                                 object_pool<queue_map>& maps)
    : m_lists(lists), m_maps(maps)
{}

pending_updates::~pending_updates() {
    clear();
}

queue_map& pending_updates::queues() {
    if (!m_queues) m_queues = m_maps.acquire();
    return *m_queues;
}

void pending_updates::enqueue(const state_key& key, state_update_ptr update) {
    auto& queue = queues()[key];
    if (!queue.records) queue.records = m_lists.acquire();
    queue.records->push_back(std::move(update));
}

void pending_updates::seed_from(const pending_updates& other) {
    if (!other.m_queues || other.m_queues->empty()) return;

    auto& mine = queues();
    for (const auto& [key, src] : *other.m_queues) {
        if (!src.records || src.records->empty()) continue;

        auto& queue = mine[key];
        if (!queue.records) queue.records = m_lists.acquire();
        queue.records->assign(src.records->begin(), src.records->end());
        queue.inherited = queue.records->size();
        queue.applied = 0;
    }
}

update_list pending_updates::snapshot(const state_key& key) const {
    if (!m_queues) return {};
    auto it = m_queues->find(key);
    if (it == m_queues->end() || !it->second.records) return {};
    return *it->second.records;
}

void pending_updates::mark_applied(const state_key& key, std::size_t count) {
    if (!m_queues) return;
    auto it = m_queues->find(key);
    if (it == m_queues->end()) return;
    it->second.applied = count;
}

std::size_t pending_updates::drain_applied(const state_key& key, const update_list& applied) {
    if (!m_queues || applied.empty()) return 0;

    auto it = m_queues->find(key);
    if (it == m_queues->end() || !it->second.records) return 0;

    auto& records = *it->second.records;
    std::size_t matched = 0;
    while (matched < applied.size() && matched < records.size() &&
           records[matched] == applied[matched]) {
        ++matched;
    }

    if (matched == records.size()) {
        m_lists.release(std::move(it->second.records));
        m_queues->erase(it);
        return matched;
    }

    records.erase(records.begin(), records.begin() + static_cast<std::ptrdiff_t>(matched));
    it->second.inherited -= std::min(it->second.inherited, matched);
    it->second.applied -= std::min(it->second.applied, matched);
    return matched;
}

keyed_updates pending_updates::applied_prefixes() const {
    keyed_updates out;
    if (!m_queues) return out;

    for (const auto& [key, queue] : *m_queues) {
        std::size_t n = std::min(queue.inherited, queue.applied);
        if (n == 0 || !queue.records) continue;
        out.emplace_back(key, update_list(queue.records->begin(),
                                          queue.records->begin() + static_cast<std::ptrdiff_t>(n)));
    }
    return out;
}

keyed_updates pending_updates::deferred() const {
    keyed_updates out;
    if (!m_queues) return out;

    for (const auto& [key, queue] : *m_queues) {
        if (!queue.records) continue;
        std::size_t from = std::max(queue.inherited, queue.applied);
        if (from >= queue.records->size()) continue;
        out.emplace_back(key, update_list(queue.records->begin() + static_cast<std::ptrdiff_t>(from),
                                          queue.records->end()));
    }
    return out;
}

std::size_t pending_updates::size(const state_key& key) const {
    if (!m_queues) return 0;
    auto it = m_queues->find(key);
    if (it == m_queues->end() || !it->second.records) return 0;
    return it->second.records->size();
}

std::size_t pending_updates::key_count() const {
    return m_queues ? m_queues->size() : 0;
}

bool pending_updates::empty() const {
    return key_count() == 0;
}

void pending_updates::clear() {
    if (!m_queues) return;

    for (auto& [key, queue] : *m_queues) {
        m_lists.release(std::move(queue.records));
    }
    m_maps.release(std::move(m_queues));
}

} // namespace reconciler
