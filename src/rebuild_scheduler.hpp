#pragma once

#include "commit_coordinator.hpp"
#include "tree_builder.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace reconciler {

// Runs seed -> build -> commit cycles for one tree on a dedicated thread.
// At most one generation is in flight; rebuild requests that pile up while a
// build runs are coalesced into the next one.
class rebuild_scheduler {
public:
    struct stats {
        uint64_t requests = 0;
        uint64_t generations = 0;
        uint64_t commits = 0;
        uint64_t failures = 0;
        uint64_t stale = 0;
        uint64_t transitions = 0;
        std::size_t queue_depth = 0;
    };

    using transition_listener = std::function<void(uint64_t generation,
                                                   std::vector<transition> transitions)>;

    rebuild_scheduler(commit_coordinator& coordinator,
                      tree_builder& builder,
                      std::shared_ptr<spdlog::logger> log);
    ~rebuild_scheduler();

    // Called with the transitions of each committed generation, on the
    // rebuild thread. Set before start().
    void set_transition_listener(transition_listener listener);

    // Spawn the rebuild thread. Must be called once.
    void start();

    // Signal the rebuild thread to stop and join it.
    void stop();

    // Ask for a new generation. Any thread.
    void request_rebuild();

    // Run one generation on the calling thread. Returns true if it committed.
    bool run_generation();

    // Blocks until the committed generation reaches generation or timeout.
    bool wait_for_generation(uint64_t generation, std::chrono::milliseconds timeout);

    // Approximate number of queued requests.
    std::size_t queue_depth() const;

    stats get_stats() const;

private:
    enum class request_kind { rebuild, stop };

    void rebuild_loop();

    commit_coordinator& m_coordinator;
    tree_builder& m_builder;
    std::shared_ptr<spdlog::logger> m_log;
    transition_listener m_listener;

    std::atomic<bool> m_running{false};

    moodycamel::BlockingConcurrentQueue<request_kind> m_queue;
    std::thread m_thread;

    std::mutex m_committed_mutex;
    std::condition_variable m_committed_cv;

    // Aggregate stats (relaxed atomics)
    std::atomic<uint64_t> m_requests{0};
    std::atomic<uint64_t> m_generations{0};
    std::atomic<uint64_t> m_commits{0};
    std::atomic<uint64_t> m_failures{0};
    std::atomic<uint64_t> m_stale{0};
    std::atomic<uint64_t> m_transitions{0};
};

} // namespace reconciler
