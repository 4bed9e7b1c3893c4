#pragma once

#include "tagscout/ranker.hpp"
#include "tagscout/types.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace tagscout {

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);

struct Settings {
    std::filesystem::path data_dir = "data";
    std::filesystem::path raw_csv;
    std::filesystem::path processed_dir;
    std::filesystem::path tag_complexity_json;

    ScoringConfig scoring;
    int64_t success_threshold = 100;

    std::string host = "0.0.0.0";
    int port = 8000;
    std::string log_level = "info";
};

// Reads TAGSCOUT_* variables; call load_env() first to pick up a .env file.
Settings load_settings();

void apply_log_level(const std::string& level);

// JSON object of tag -> complexity in [1,5]. Out-of-range or non-integer
// entries are skipped.
std::expected<ComplexityMap, Error> load_tag_complexity(
    const std::filesystem::path& path);

} // namespace tagscout
