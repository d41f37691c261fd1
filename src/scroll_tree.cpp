#include "scroll_tree.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace reconciler {

scroll_tree::scroll_tree(uint32_t row_count, uint32_t visible_rows,
                         std::shared_ptr<spdlog::logger> log)
    : m_row_count(row_count), m_visible_rows(visible_rows), m_log(std::move(log))
{
    if (m_row_count == 0 || m_visible_rows == 0 || m_visible_rows > m_row_count) {
        throw std::invalid_argument("scroll_tree: visible_rows must be in [1, row_count]");
    }
}

state_key scroll_tree::row_key(uint32_t index) {
    return "row/" + std::to_string(index);
}

std::vector<state_key> scroll_tree::visible_keys() const {
    uint32_t first = offset();
    std::vector<state_key> keys;
    keys.reserve(m_visible_rows);
    for (uint32_t i = 0; i < m_visible_rows; ++i) {
        keys.push_back(row_key((first + i) % m_row_count));
    }
    return keys;
}

void scroll_tree::scroll_by(uint32_t rows) {
    uint32_t current = m_offset.load(std::memory_order_relaxed);
    uint32_t next;
    do {
        next = static_cast<uint32_t>((static_cast<uint64_t>(current) + rows) % m_row_count);
    } while (!m_offset.compare_exchange_weak(current, next, std::memory_order_relaxed));
}

void scroll_tree::build(state_store& working) {
    const uint64_t generation = working.generation();
    uint64_t created = 0;

    for (const auto& key : visible_keys()) {
        working.reconcile(key, [&] {
            ++created;
            auto state = std::make_unique<row_state>();
            state->created_generation = generation;
            return state;
        });
    }

    m_rows_built.fetch_add(m_visible_rows, std::memory_order_relaxed);
    m_rows_created.fetch_add(created, std::memory_order_relaxed);

    if (created > 0) {
        m_log->trace("generation {}: {} rows entered the window", generation, created);
    }
}

scroll_tree::stats scroll_tree::get_stats() const {
    return {
        m_rows_built.load(std::memory_order_relaxed),
        m_rows_created.load(std::memory_order_relaxed)
    };
}

state_update_ptr scroll_tree::make_tap() {
    return make_typed_update<row_state>(
        [](row_state& s, const update_context&) { ++s.taps; },
        "tap");
}

state_update_ptr scroll_tree::make_toggle() {
    return make_typed_update<row_state>(
        [](row_state& s, const update_context&) {
            s.expanded = !s.expanded;
            s.emit_transition({{}, "height", std::chrono::milliseconds(200), "ease_in_out"});
        },
        "toggle");
}

} // namespace reconciler
