#pragma once

#include "commit_coordinator.hpp"
#include "config.hpp"
#include "rebuild_scheduler.hpp"
#include "scroll_tree.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace reconciler {

// Drives a scroll_tree at frame rate while producer threads tap and toggle
// the visible rows.
class simulation {
public:
    simulation(asio::io_context& ioc, const config& cfg,
               std::shared_ptr<spdlog::logger> log);
    ~simulation();

    // Start the rebuild thread, the producers and the frame/stats loops.
    void start();

    // Stop producers and the rebuild thread. Called after the io_context
    // has stopped.
    void stop();

    // Counters of every component, for the end-of-run report.
    nlohmann::json summary() const;

private:
    // Scroll and request a rebuild once per frame
    asio::awaitable<void> frame_loop();

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    void producer_loop(unsigned int producer_id);

    void on_transitions(uint64_t generation, std::vector<transition> transitions);

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    commit_coordinator m_coordinator;
    scroll_tree m_tree;
    rebuild_scheduler m_scheduler;

    std::atomic<bool> m_running{false};
    std::vector<std::thread> m_producers;

    std::atomic<uint64_t> m_taps_enqueued{0};
    std::atomic<uint64_t> m_toggles_enqueued{0};
    std::atomic<uint64_t> m_transitions_received{0};
};

} // namespace reconciler
