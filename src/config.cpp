#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace reconciler {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "trace")                   return spdlog::level::trace;
    if (s == "debug")                   return spdlog::level::debug;
    if (s == "info")                    return spdlog::level::info;
    if (s == "warn" || s == "warning")  return spdlog::level::warn;
    if (s == "error" || s == "err")     return spdlog::level::err;
    if (s == "off")                     return spdlog::level::off;
    return std::nullopt;
}

config load_config(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    config cfg;

    // Engine pools
    if (auto engine = root["engine"]) {
        if (!engine.IsMap()) throw std::runtime_error("config: 'engine' must be a map");
        if (auto n = engine["pool_capacity"])                cfg.engine.pool_capacity = n.as<std::size_t>();
        if (auto n = engine["initial_update_list_capacity"]) cfg.engine.initial_update_list_capacity = n.as<std::size_t>();
        if (auto n = engine["initial_map_capacity"])         cfg.engine.initial_map_capacity = n.as<std::size_t>();
    }

    // Tree
    if (auto n = root["row_count"])         cfg.row_count = n.as<uint32_t>();
    if (auto n = root["visible_rows"])      cfg.visible_rows = n.as<uint32_t>();
    if (auto n = root["scroll_step"])       cfg.scroll_step = n.as<uint32_t>();
    if (auto n = root["frame_interval_ms"]) cfg.frame_interval_ms = n.as<uint32_t>();

    if (cfg.row_count == 0) {
        throw std::runtime_error("config: 'row_count' must be positive");
    }
    if (cfg.visible_rows == 0 || cfg.visible_rows > cfg.row_count) {
        throw std::runtime_error("config: 'visible_rows' must be in [1, row_count]");
    }
    if (cfg.frame_interval_ms == 0) {
        throw std::runtime_error("config: 'frame_interval_ms' must be positive");
    }

    // Producers
    if (auto n = root["producer_threads"])   cfg.producer_threads = n.as<unsigned int>();
    if (auto n = root["updates_per_second"]) cfg.updates_per_second = n.as<uint32_t>();

    // Operational
    if (auto n = root["generations"])            cfg.generations = n.as<uint64_t>();
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"]) {
        cfg.log_level = n.as<std::string>();
        if (!parse_log_level(cfg.log_level)) {
            throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
        }
    }

    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }

    return cfg;
}

} // namespace reconciler
