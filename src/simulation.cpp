#include "simulation.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <chrono>
#include <random>

namespace reconciler {

simulation::simulation(asio::io_context& ioc, const config& cfg,
                       std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_coordinator(cfg.engine, m_log),
      m_tree(cfg.row_count, cfg.visible_rows, m_log),
      m_scheduler(m_coordinator, m_tree, m_log)
{
    m_scheduler.set_transition_listener(
        [this](uint64_t generation, std::vector<transition> transitions) {
            on_transitions(generation, std::move(transitions));
        });
}

simulation::~simulation() {
    stop();
}

void simulation::start() {
    if (m_running.exchange(true)) return; // already started

    m_scheduler.start();

    m_producers.reserve(m_cfg.producer_threads);
    for (unsigned int i = 0; i < m_cfg.producer_threads; ++i) {
        m_producers.emplace_back(&simulation::producer_loop, this, i);
    }

    asio::co_spawn(m_ioc, frame_loop(), asio::detached);
    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    m_log->info("Simulation started ({} rows, {} visible, {} producers, frame={}ms)",
               m_cfg.row_count, m_cfg.visible_rows, m_cfg.producer_threads,
               m_cfg.frame_interval_ms);
}

void simulation::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    for (auto& t : m_producers) {
        if (t.joinable()) t.join();
    }
    m_producers.clear();

    m_scheduler.stop();
    m_log->info("Simulation stopped at generation {}", m_coordinator.generation());
}

void simulation::on_transitions(uint64_t generation, std::vector<transition> transitions) {
    m_transitions_received.fetch_add(transitions.size(), std::memory_order_relaxed);
    for (const auto& t : transitions) {
        m_log->trace("generation {}: transition {} on '{}' ({}ms, {})",
                    generation, t.property, t.key, t.duration.count(), t.curve);
    }
}

void simulation::producer_loop(unsigned int producer_id) {
    m_log->debug("Producer {} started", producer_id);

    std::mt19937 rng(producer_id + 1);
    std::uniform_int_distribution<int> action(0, 9);

    const auto interval = m_cfg.updates_per_second > 0
        ? std::chrono::microseconds(1'000'000 / m_cfg.updates_per_second)
        : std::chrono::microseconds(100'000);

    while (m_running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(interval);
        if (m_cfg.updates_per_second == 0) continue;

        auto keys = m_tree.visible_keys();
        std::uniform_int_distribution<std::size_t> pick(0, keys.size() - 1);
        const auto& key = keys[pick(rng)];

        // Roughly one toggle per ten interactions
        if (action(rng) == 0) {
            m_coordinator.enqueue(key, scroll_tree::make_toggle());
            m_toggles_enqueued.fetch_add(1, std::memory_order_relaxed);
        } else {
            m_coordinator.enqueue(key, scroll_tree::make_tap());
            m_taps_enqueued.fetch_add(1, std::memory_order_relaxed);
        }
    }

    m_log->debug("Producer {} stopped", producer_id);
}

asio::awaitable<void> simulation::frame_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (m_running.load(std::memory_order_relaxed)) {
        timer.expires_after(std::chrono::milliseconds(m_cfg.frame_interval_ms));
        co_await timer.async_wait(asio::use_awaitable);

        if (m_cfg.generations > 0 && m_coordinator.generation() >= m_cfg.generations) {
            m_log->info("Reached {} generations", m_cfg.generations);
            m_ioc.stop();
            co_return;
        }

        m_tree.scroll_by(m_cfg.scroll_step);
        m_scheduler.request_rebuild();
    }
}

asio::awaitable<void> simulation::stats_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (m_running.load(std::memory_order_relaxed)) {
        timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        co_await timer.async_wait(asio::use_awaitable);

        auto cs = m_coordinator.get_stats();
        auto rs = m_scheduler.get_stats();

        m_log->info("stats: generation={} requests={} commits={} failures={} stale={} "
                   "containers={} pending_keys={} drained={} collected={} "
                   "taps={} toggles={} transitions={} pool_hits={} pool_misses={} queue_depth={}",
                   cs.generation, rs.requests, rs.commits, rs.failures, rs.stale,
                   cs.containers, cs.pending_keys, cs.updates_drained, cs.containers_collected,
                   m_taps_enqueued.load(), m_toggles_enqueued.load(),
                   m_transitions_received.load(), cs.pool_hits, cs.pool_misses,
                   rs.queue_depth);
    }
}

nlohmann::json simulation::summary() const {
    auto cs = m_coordinator.get_stats();
    auto rs = m_scheduler.get_stats();
    auto ts = m_tree.get_stats();

    return {
        {"generation", cs.generation},
        {"scheduler", {
            {"requests", rs.requests},
            {"generations", rs.generations},
            {"commits", rs.commits},
            {"failures", rs.failures},
            {"stale", rs.stale},
            {"transitions", rs.transitions}
        }},
        {"store", {
            {"containers", cs.containers},
            {"pending_keys", cs.pending_keys},
            {"updates_drained", cs.updates_drained},
            {"containers_collected", cs.containers_collected},
            {"discards", cs.discards}
        }},
        {"pools", {
            {"hits", cs.pool_hits},
            {"misses", cs.pool_misses}
        }},
        {"tree", {
            {"rows_built", ts.rows_built},
            {"rows_created", ts.rows_created},
            {"offset", m_tree.offset()}
        }},
        {"producers", {
            {"taps", m_taps_enqueued.load()},
            {"toggles", m_toggles_enqueued.load()},
            {"transitions_received", m_transitions_received.load()}
        }}
    };
}

} // namespace reconciler
