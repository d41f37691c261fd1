#pragma once

#include <spdlog/common.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace reconciler {

// Sizing of the pools shared by all stores of one tree.
struct engine_config {
    // Max idle objects each pool keeps for reuse (0 disables pooling)
    std::size_t pool_capacity = 10;

    // Reserved on fresh allocation only
    std::size_t initial_update_list_capacity = 4;
    std::size_t initial_map_capacity = 4;
};

struct config {
    engine_config engine;

    // Scroll-window tree
    uint32_t row_count = 1000;
    uint32_t visible_rows = 24;
    uint32_t scroll_step = 1;       // rows scrolled per frame
    uint32_t frame_interval_ms = 16;

    // Update producers
    unsigned int producer_threads = 2;
    uint32_t updates_per_second = 200;  // per producer

    // Stop after this many committed generations (0 = run until signalled)
    uint64_t generations = 0;

    // Operational
    int stats_interval_seconds = 5;
    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse a log level name. Returns nullopt if invalid.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace reconciler
