#include "transition_collector.hpp"
#include <iterator>
#include <utility>

namespace reconciler {

void transition_collector::add(const state_key& key, std::vector<transition> transitions) {
    for (auto& t : transitions) {
        t.key = key;
        m_transitions.push_back(std::move(t));
    }
}

void transition_collector::append(std::vector<transition> transitions) {
    if (m_transitions.empty()) {
        m_transitions = std::move(transitions);
        return;
    }
    m_transitions.insert(m_transitions.end(),
                         std::make_move_iterator(transitions.begin()),
                         std::make_move_iterator(transitions.end()));
}

std::vector<transition> transition_collector::consume() {
    std::vector<transition> out;
    out.swap(m_transitions);
    return out;
}

} // namespace reconciler
