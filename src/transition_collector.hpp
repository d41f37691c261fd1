#pragma once

#include "state_types.hpp"
#include <cstddef>
#include <vector>

namespace reconciler {

// Transitions emitted by state updates, kept in per-key-then-per-update order
// until the consumer takes them. Not synchronized; guarded by the owning store.
class transition_collector {
public:
    // Stamp each transition with key and append.
    void add(const state_key& key, std::vector<transition> transitions);

    // Append transitions already stamped by another collector.
    void append(std::vector<transition> transitions);

    // One-shot: returns everything collected so far and clears the buffer.
    std::vector<transition> consume();

    std::size_t size() const { return m_transitions.size(); }
    bool empty() const { return m_transitions.empty(); }

private:
    std::vector<transition> m_transitions;
};

} // namespace reconciler
