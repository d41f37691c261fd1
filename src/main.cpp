#include "config.hpp"
#include "simulation.hpp"
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    cxxopts::Options options("state_reconciler",
        "Drives the generational state reconciliation engine with a scrolling tree");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("g,generations", "Stop after N generations (overrides config)", cxxopts::value<uint64_t>())
        ("j,json", "Print a JSON summary on exit")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("reconciler");

    // Load config; without one the defaults apply
    reconciler::config cfg;
    if (result.count("config")) {
        try {
            cfg = reconciler::load_config(result["config"].as<std::string>());
        } catch (const std::exception& e) {
            console->error("Failed to load config: {}", e.what());
            return 1;
        }
    }

    // CLI overrides
    if (result.count("generations")) cfg.generations = result["generations"].as<uint64_t>();
    if (result.count("verbose"))     cfg.log_level = "debug";

    auto level = reconciler::parse_log_level(cfg.log_level);
    spdlog::set_level(level ? *level : spdlog::level::info);

    console->info("state_reconciler starting");
    console->info("  rows: {} ({} visible, scroll step {})",
                 cfg.row_count, cfg.visible_rows, cfg.scroll_step);
    console->info("  frame interval: {}ms", cfg.frame_interval_ms);
    console->info("  producers: {} x {} updates/s", cfg.producer_threads, cfg.updates_per_second);
    console->info("  pools: capacity {}, list reserve {}, map reserve {}",
                 cfg.engine.pool_capacity, cfg.engine.initial_update_list_capacity,
                 cfg.engine.initial_map_capacity);

    // Single-threaded io_context (frame + stats timers)
    asio::io_context ioc(1);

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        ioc.stop();
    });

    std::unique_ptr<reconciler::simulation> sim;
    try {
        sim = std::make_unique<reconciler::simulation>(ioc, cfg, console);
    } catch (const std::exception& e) {
        console->error("Failed to set up simulation: {}", e.what());
        return 1;
    }

    sim->start();

    // Run the event loop (single thread)
    ioc.run();

    // Producers and the rebuild thread outlive the timers; join them here
    sim->stop();

    if (result.count("json")) {
        std::cout << sim->summary().dump(2) << std::endl;
    }

    console->info("state_reconciler stopped");
    return 0;
}
