#include "config.hpp"
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

// Writes contents to a unique temp file, removed on destruction.
class temp_yaml {
public:
    explicit temp_yaml(const std::string& contents) {
        static int counter = 0;
        m_path = std::filesystem::temp_directory_path() /
                 ("reconciler_config_" + std::to_string(::getpid()) + "_" +
                  std::to_string(counter++) + ".yaml");
        std::ofstream out(m_path);
        out << contents;
    }
    ~temp_yaml() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }
    std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

} // namespace

TEST(config_parsing, parse_log_level) {
    EXPECT_EQ(reconciler::parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(reconciler::parse_log_level("info"),  spdlog::level::info);
    EXPECT_EQ(reconciler::parse_log_level("warn"),  spdlog::level::warn);
    EXPECT_EQ(reconciler::parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(reconciler::parse_log_level("off"),   spdlog::level::off);
    EXPECT_FALSE(reconciler::parse_log_level("loud").has_value());
}

TEST(config_parsing, empty_file_gives_defaults) {
    temp_yaml file("{}\n");
    auto cfg = reconciler::load_config(file.path());

    EXPECT_EQ(cfg.engine.pool_capacity, 10u);
    EXPECT_EQ(cfg.engine.initial_update_list_capacity, 4u);
    EXPECT_EQ(cfg.engine.initial_map_capacity, 4u);
    EXPECT_EQ(cfg.row_count, 1000u);
    EXPECT_EQ(cfg.visible_rows, 24u);
    EXPECT_EQ(cfg.generations, 0u);
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(config_parsing, full_file) {
    temp_yaml file(
        "engine:\n"
        "  pool_capacity: 32\n"
        "  initial_update_list_capacity: 8\n"
        "  initial_map_capacity: 16\n"
        "row_count: 200\n"
        "visible_rows: 10\n"
        "scroll_step: 2\n"
        "frame_interval_ms: 8\n"
        "producer_threads: 3\n"
        "updates_per_second: 50\n"
        "generations: 120\n"
        "stats_interval_seconds: 1\n"
        "log_level: debug\n");

    auto cfg = reconciler::load_config(file.path());
    EXPECT_EQ(cfg.engine.pool_capacity, 32u);
    EXPECT_EQ(cfg.engine.initial_update_list_capacity, 8u);
    EXPECT_EQ(cfg.engine.initial_map_capacity, 16u);
    EXPECT_EQ(cfg.row_count, 200u);
    EXPECT_EQ(cfg.visible_rows, 10u);
    EXPECT_EQ(cfg.scroll_step, 2u);
    EXPECT_EQ(cfg.frame_interval_ms, 8u);
    EXPECT_EQ(cfg.producer_threads, 3u);
    EXPECT_EQ(cfg.updates_per_second, 50u);
    EXPECT_EQ(cfg.generations, 120u);
    EXPECT_EQ(cfg.stats_interval_seconds, 1);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(config_parsing, rejects_window_larger_than_list) {
    temp_yaml file("row_count: 5\nvisible_rows: 6\n");
    EXPECT_THROW(reconciler::load_config(file.path()), std::runtime_error);
}

TEST(config_parsing, rejects_invalid_log_level) {
    temp_yaml file("log_level: loud\n");
    EXPECT_THROW(reconciler::load_config(file.path()), std::runtime_error);
}

TEST(config_parsing, rejects_non_map_engine_section) {
    temp_yaml file("engine: 4\n");
    EXPECT_THROW(reconciler::load_config(file.path()), std::runtime_error);
}

TEST(config_parsing, missing_file_throws) {
    EXPECT_THROW(reconciler::load_config("/nonexistent/reconciler.yaml"), YAML::BadFile);
}
