#pragma once

#include "state_store.hpp"

namespace reconciler {

// The declarative tree: decides which keys exist in a generation and visits
// each stateful one against the working store, via
// materialize -> fresh-init or clone -> apply_updates_for (or reconcile()).
class tree_builder {
public:
    virtual ~tree_builder() = default;

    // Runs on the rebuild thread. May throw; the generation is then discarded.
    virtual void build(state_store& working) = 0;
};

} // namespace reconciler
