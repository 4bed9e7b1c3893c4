#pragma once

#include "tagscout/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tagscout {

inline constexpr int success_window_months = 24;
inline constexpr int volume_window_months = 6;
inline constexpr int trend_recent_months = 6;
inline constexpr int trend_prior_months = 12;

// One bucket per observed (tag, month), sorted by tag then month.
std::vector<MonthlyTagBucket> build_month_stats(
    const std::vector<GameRecord>& records);

std::optional<YearMonth> max_month(const std::vector<MonthlyTagBucket>& buckets);

// Windows are anchored on the latest month present in the whole table.
// One row per tag, sorted by tag.
std::vector<TagSummary> summarize_tags(
    const std::vector<MonthlyTagBucket>& buckets);

// Case-insensitive match; empty for an unknown tag.
std::vector<TimeseriesPoint> tag_timeseries(
    const std::string& tag, const std::vector<MonthlyTagBucket>& buckets);

std::vector<std::string> list_tags(const std::vector<TagSummary>& summaries);

} // namespace tagscout
