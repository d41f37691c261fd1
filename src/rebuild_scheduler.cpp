#include "rebuild_scheduler.hpp"
#include <array>
#include <exception>
#include <utility>

namespace reconciler {

rebuild_scheduler::rebuild_scheduler(commit_coordinator& coordinator,
                                     tree_builder& builder,
                                     std::shared_ptr<spdlog::logger> log)
    : m_coordinator(coordinator), m_builder(builder), m_log(std::move(log))
{}

rebuild_scheduler::~rebuild_scheduler() {
    stop();
}

void rebuild_scheduler::set_transition_listener(transition_listener listener) {
    m_listener = std::move(listener);
}

void rebuild_scheduler::start() {
    if (m_running.exchange(true)) return; // already started

    m_thread = std::thread(&rebuild_scheduler::rebuild_loop, this);
    m_log->info("Rebuild scheduler started");
}

void rebuild_scheduler::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Poison pill
    m_queue.enqueue(request_kind::stop);

    if (m_thread.joinable()) m_thread.join();
    m_log->info("Rebuild scheduler stopped");
}

void rebuild_scheduler::request_rebuild() {
    m_requests.fetch_add(1, std::memory_order_relaxed);
    m_queue.enqueue(request_kind::rebuild);
}

std::size_t rebuild_scheduler::queue_depth() const {
    return m_queue.size_approx();
}

rebuild_scheduler::stats rebuild_scheduler::get_stats() const {
    return {
        m_requests.load(std::memory_order_relaxed),
        m_generations.load(std::memory_order_relaxed),
        m_commits.load(std::memory_order_relaxed),
        m_failures.load(std::memory_order_relaxed),
        m_stale.load(std::memory_order_relaxed),
        m_transitions.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

bool rebuild_scheduler::run_generation() {
    auto working = m_coordinator.begin_generation();
    const uint64_t generation = working->generation();
    m_generations.fetch_add(1, std::memory_order_relaxed);

    try {
        working->begin_build();
        m_builder.build(*working);
    } catch (const std::exception& e) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        m_log->error("Build of generation {} failed: {}", generation, e.what());
        m_coordinator.discard(std::move(working));
        return false;
    }

    if (!m_coordinator.commit(std::move(working))) {
        m_stale.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    m_commits.fetch_add(1, std::memory_order_relaxed);

    // Without a listener the transitions stay with the committed store
    if (m_listener) {
        auto transitions = m_coordinator.consume_transitions();
        if (!transitions.empty()) {
            m_transitions.fetch_add(transitions.size(), std::memory_order_relaxed);
            m_listener(generation, std::move(transitions));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_committed_mutex);
    }
    m_committed_cv.notify_all();
    return true;
}

bool rebuild_scheduler::wait_for_generation(uint64_t generation,
                                            std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_committed_mutex);
    return m_committed_cv.wait_for(lock, timeout, [&] {
        return m_coordinator.generation() >= generation;
    });
}

void rebuild_scheduler::rebuild_loop() {
    m_log->debug("Rebuild thread started");

    std::array<request_kind, 32> drained;
    request_kind request;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        bool got = m_queue.wait_dequeue_timed(request, std::chrono::milliseconds(100));
        if (!got) continue;

        if (request == request_kind::stop) break;

        // Everything queued up to now is served by this one generation
        bool stop_seen = false;
        std::size_t n;
        while ((n = m_queue.try_dequeue_bulk(drained.begin(), drained.size())) > 0) {
            for (std::size_t i = 0; i < n; ++i) {
                if (drained[i] == request_kind::stop) stop_seen = true;
            }
        }

        if (!run_generation()) {
            m_log->debug("Generation not committed; waiting for the next request");
        }

        if (stop_seen) break;
    }

    m_log->debug("Rebuild thread stopped");
}

} // namespace reconciler
