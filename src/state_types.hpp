#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace reconciler {

// Stable identifier of one node of the declarative tree across generations.
using state_key = std::string;

// Animation side effect emitted while a state update is applied.
// Collected per generation and handed to the consumer exactly once.
struct transition {
    state_key key;  // stamped by the store that collected it
    std::string property;
    std::chrono::milliseconds duration{0};
    std::string curve = "ease_in_out";
};

// Holds the current state values for one key.
//
// Concrete containers derive from this and implement clone(), which is used to
// carry a container from the committed store into a new, independently owned
// working copy. Once a store publishes a container it is never mutated again.
class state_container {
public:
    virtual ~state_container() = default;

    virtual std::unique_ptr<state_container> clone() const = 0;

    bool has_transitions() const { return !m_transitions.empty(); }

    // Returns the transitions emitted since the last call and clears them.
    std::vector<transition> consume_transitions() {
        std::vector<transition> out;
        out.swap(m_transitions);
        return out;
    }

    void emit_transition(transition t) { m_transitions.push_back(std::move(t)); }

protected:
    state_container() = default;
    state_container(const state_container&) = default;
    state_container& operator=(const state_container&) = default;

private:
    std::vector<transition> m_transitions;
};

struct update_context {
    const state_key& key;
    uint64_t generation;
};

// Immutable description of one state mutation. Shared by pointer between the
// committed queue and the working copies seeded from it; applied exactly once.
class state_update {
public:
    using apply_fn = std::function<void(state_container&, const update_context&)>;

    explicit state_update(apply_fn fn, std::string description = {})
        : m_fn(std::move(fn)),
          m_description(std::move(description)),
          m_sequence(s_next_sequence.fetch_add(1, std::memory_order_relaxed))
    {}

    void apply(state_container& container, const update_context& ctx) const {
        m_fn(container, ctx);
    }

    const std::string& description() const { return m_description; }

    // Process-unique, increasing in construction order.
    uint64_t sequence() const { return m_sequence; }

private:
    apply_fn m_fn;
    std::string m_description;
    uint64_t m_sequence;

    static inline std::atomic<uint64_t> s_next_sequence{1};
};

using state_update_ptr = std::shared_ptr<const state_update>;

inline state_update_ptr make_update(state_update::apply_fn fn, std::string description = {}) {
    return std::make_shared<const state_update>(std::move(fn), std::move(description));
}

// Typed convenience: the update only ever sees containers of type State.
template <typename State, typename Fn>
state_update_ptr make_typed_update(Fn fn, std::string description = {}) {
    return make_update(
        [fn = std::move(fn)](state_container& c, const update_context& ctx) {
            fn(static_cast<State&>(c), ctx);
        },
        std::move(description));
}

} // namespace reconciler
