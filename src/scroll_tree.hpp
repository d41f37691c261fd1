#pragma once

#include "tree_builder.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace reconciler {

// State of one list row.
struct row_state : state_container {
    uint32_t taps = 0;
    bool expanded = false;
    uint64_t created_generation = 0;

    std::unique_ptr<state_container> clone() const override {
        return std::make_unique<row_state>(*this);
    }
};

// A long list of which only a window of rows is built each generation.
// Scrolling moves the window, so rows leave and re-enter the tree at frame
// rate and their state is created, carried forward and dropped accordingly.
class scroll_tree : public tree_builder {
public:
    struct stats {
        uint64_t rows_built = 0;
        uint64_t rows_created = 0;
    };

    scroll_tree(uint32_t row_count, uint32_t visible_rows,
                std::shared_ptr<spdlog::logger> log);

    void build(state_store& working) override;

    // Advance the window, wrapping at the end of the list.
    void scroll_by(uint32_t rows);

    uint32_t offset() const { return m_offset.load(std::memory_order_relaxed); }

    std::vector<state_key> visible_keys() const;

    stats get_stats() const;

    static state_key row_key(uint32_t index);

    // Increments the tap counter.
    static state_update_ptr make_tap();

    // Flips the expanded flag and emits a height transition.
    static state_update_ptr make_toggle();

private:
    const uint32_t m_row_count;
    const uint32_t m_visible_rows;
    std::shared_ptr<spdlog::logger> m_log;

    std::atomic<uint32_t> m_offset{0};

    std::atomic<uint64_t> m_rows_built{0};
    std::atomic<uint64_t> m_rows_created{0};
};

} // namespace reconciler
