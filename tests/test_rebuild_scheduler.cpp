#include "rebuild_scheduler.hpp"
#include "scroll_tree.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using reconciler::commit_coordinator;
using reconciler::engine_config;
using reconciler::rebuild_scheduler;
using reconciler::state_key;
using reconciler::state_store;
using test_support::as_counter;
using test_support::make_add;
using test_support::make_animate;
using test_support::make_counter;
using test_support::make_log;

namespace {

class key_list_tree : public reconciler::tree_builder {
public:
    void set_keys(std::vector<state_key> keys) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_keys = std::move(keys);
    }

    void fail_next() { m_fail.store(true); }

    int builds() const { return m_builds.load(); }

    void build(state_store& working) override {
        m_builds.fetch_add(1);
        std::vector<state_key> keys;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            keys = m_keys;
        }
        for (const auto& key : keys) {
            working.reconcile(key, [] { return make_counter(); });
        }
        if (m_fail.exchange(false)) {
            throw std::runtime_error("layout failed");
        }
    }

private:
    std::mutex m_mutex;
    std::vector<state_key> m_keys;
    std::atomic<bool> m_fail{false};
    std::atomic<int> m_builds{0};
};

} // namespace

TEST(rebuild_scheduler, run_generation_commits) {
    commit_coordinator coord(engine_config{}, make_log());
    key_list_tree tree;
    tree.set_keys({"A", "B"});
    rebuild_scheduler scheduler(coord, tree, make_log());

    coord.enqueue("A", make_add(2));
    ASSERT_TRUE(scheduler.run_generation());

    EXPECT_EQ(coord.generation(), 1u);
    EXPECT_EQ(as_counter(coord.committed().find("A")).value, 2);
    EXPECT_TRUE(coord.committed().find("B"));

    auto s = scheduler.get_stats();
    EXPECT_EQ(s.generations, 1u);
    EXPECT_EQ(s.commits, 1u);
}

TEST(rebuild_scheduler, failed_build_is_discarded) {
    commit_coordinator coord(engine_config{}, make_log());
    key_list_tree tree;
    tree.set_keys({"A"});
    rebuild_scheduler scheduler(coord, tree, make_log());

    coord.enqueue("A", make_add(1));
    tree.fail_next();
    EXPECT_FALSE(scheduler.run_generation());

    EXPECT_EQ(coord.generation(), 0u);
    EXPECT_TRUE(coord.is_empty());
    EXPECT_EQ(coord.committed().pending_count("A"), 1u);
    EXPECT_EQ(scheduler.get_stats().failures, 1u);

    // The update survives for the next attempt
    ASSERT_TRUE(scheduler.run_generation());
    EXPECT_EQ(as_counter(coord.committed().find("A")).value, 1);
}

TEST(rebuild_scheduler, empty_tree_drops_previous_state) {
    commit_coordinator coord(engine_config{}, make_log());
    key_list_tree tree;
    tree.set_keys({"A", "B"});
    rebuild_scheduler scheduler(coord, tree, make_log());

    ASSERT_TRUE(scheduler.run_generation());
    EXPECT_EQ(coord.committed().container_count(), 2u);

    tree.set_keys({});
    ASSERT_TRUE(scheduler.run_generation());
    EXPECT_EQ(coord.committed().container_count(), 0u);
    EXPECT_TRUE(coord.is_empty());
}

TEST(rebuild_scheduler, transitions_reach_listener) {
    commit_coordinator coord(engine_config{}, make_log());
    key_list_tree tree;
    tree.set_keys({"A"});
    rebuild_scheduler scheduler(coord, tree, make_log());

    std::vector<std::string> received;
    uint64_t received_generation = 0;
    scheduler.set_transition_listener(
        [&](uint64_t generation, std::vector<reconciler::transition> transitions) {
            received_generation = generation;
            for (const auto& t : transitions) received.push_back(t.key + ":" + t.property);
        });

    coord.enqueue("A", make_animate("opacity"));
    ASSERT_TRUE(scheduler.run_generation());
    ASSERT_TRUE(scheduler.run_generation());

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], "A:opacity");
    EXPECT_EQ(received_generation, 1u);
    EXPECT_EQ(scheduler.get_stats().transitions, 1u);
}

TEST(rebuild_scheduler, threaded_requests_are_served) {
    commit_coordinator coord(engine_config{}, make_log());
    key_list_tree tree;
    tree.set_keys({"A"});
    rebuild_scheduler scheduler(coord, tree, make_log());
    scheduler.start();

    coord.enqueue("A", make_add(1));
    scheduler.request_rebuild();
    ASSERT_TRUE(scheduler.wait_for_generation(1, std::chrono::seconds(5)));

    coord.enqueue("A", make_add(1));
    scheduler.request_rebuild();
    ASSERT_TRUE(scheduler.wait_for_generation(2, std::chrono::seconds(5)));

    scheduler.stop();
    EXPECT_EQ(as_counter(coord.committed().find("A")).value, 2);
}

TEST(rebuild_scheduler, burst_of_requests_is_coalesced) {
    commit_coordinator coord(engine_config{}, make_log());
    key_list_tree tree;
    tree.set_keys({"A"});
    rebuild_scheduler scheduler(coord, tree, make_log());

    // Queue the burst before the thread exists so one dequeue sees all of it
    for (int i = 0; i < 50; ++i) scheduler.request_rebuild();
    scheduler.start();

    ASSERT_TRUE(scheduler.wait_for_generation(1, std::chrono::seconds(5)));
    scheduler.stop();

    EXPECT_EQ(scheduler.get_stats().requests, 50u);
    EXPECT_LT(tree.builds(), 50);
    EXPECT_GE(tree.builds(), 1);
}

TEST(rebuild_scheduler, stop_is_idempotent) {
    commit_coordinator coord(engine_config{}, make_log());
    key_list_tree tree;
    rebuild_scheduler scheduler(coord, tree, make_log());
    scheduler.start();
    scheduler.stop();
    scheduler.stop();
    SUCCEED();
}

// --- scroll_tree ---

TEST(scroll_tree, window_rows_keep_state_and_leavers_are_dropped) {
    commit_coordinator coord(engine_config{}, make_log());
    reconciler::scroll_tree tree(10, 3, make_log());
    rebuild_scheduler scheduler(coord, tree, make_log());

    coord.enqueue("row/1", reconciler::scroll_tree::make_tap());
    coord.enqueue("row/1", reconciler::scroll_tree::make_tap());
    ASSERT_TRUE(scheduler.run_generation());
    EXPECT_EQ(coord.committed().container_count(), 3u);

    tree.scroll_by(1);  // window is now rows 1..3
    ASSERT_TRUE(scheduler.run_generation());

    EXPECT_EQ(coord.committed().find("row/0"), nullptr);
    auto row1 = coord.committed().find("row/1");
    ASSERT_TRUE(row1);
    const auto& s = static_cast<const reconciler::row_state&>(*row1);
    EXPECT_EQ(s.taps, 2u);
    EXPECT_EQ(s.created_generation, 1u);

    auto row3 = coord.committed().find("row/3");
    ASSERT_TRUE(row3);
    EXPECT_EQ(static_cast<const reconciler::row_state&>(*row3).created_generation, 2u);
}

TEST(scroll_tree, toggle_emits_height_transition) {
    commit_coordinator coord(engine_config{}, make_log());
    reconciler::scroll_tree tree(5, 2, make_log());
    rebuild_scheduler scheduler(coord, tree, make_log());

    coord.enqueue("row/0", reconciler::scroll_tree::make_toggle());
    ASSERT_TRUE(scheduler.run_generation());

    auto transitions = coord.consume_transitions();
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions[0].key, "row/0");
    EXPECT_EQ(transitions[0].property, "height");
    EXPECT_TRUE(static_cast<const reconciler::row_state&>(*coord.committed().find("row/0")).expanded);
}

TEST(scroll_tree, scroll_wraps_around) {
    reconciler::scroll_tree tree(4, 2, make_log());
    tree.scroll_by(3);
    auto keys = tree.visible_keys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "row/3");
    EXPECT_EQ(keys[1], "row/0");
}

TEST(scroll_tree, invalid_window_throws) {
    EXPECT_THROW(reconciler::scroll_tree(3, 4, make_log()), std::invalid_argument);
    EXPECT_THROW(reconciler::scroll_tree(3, 0, make_log()), std::invalid_argument);
}
