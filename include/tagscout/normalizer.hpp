#pragma once

#include "tagscout/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tagscout {

inline constexpr int64_t default_success_threshold = 100;

// Accepts a JSON array, a JSON object (keys are tags) or a comma-separated
// list. Malformed JSON yields an empty set.
std::vector<std::string> parse_tags(const std::string& raw);

std::optional<YearMonth> parse_release_month(const std::string& raw);

int64_t parse_review_count(const std::optional<std::string>& raw);

GameRecord normalize_record(const RawGameRecord& raw,
                            int64_t success_threshold = default_success_threshold);

std::vector<GameRecord> normalize_records(
    const std::vector<RawGameRecord>& raw,
    int64_t success_threshold = default_success_threshold);

} // namespace tagscout
