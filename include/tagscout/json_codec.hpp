#pragma once

#include "tagscout/types.hpp"
#include <expected>
#include <optional>
#include <nlohmann/json.hpp>

namespace tagscout {

void to_json(nlohmann::json& j, const MonthlyTagBucket& b);
void to_json(nlohmann::json& j, const TagSummary& s);
void to_json(nlohmann::json& j, const TimeseriesPoint& p);
void to_json(nlohmann::json& j, const Recommendation& r);
void to_json(nlohmann::json& j, const RecommendationRequest& r);

// Row parsers for cached tables; nullopt when a required field is missing.
std::optional<MonthlyTagBucket> parse_bucket(const nlohmann::json& j);
std::optional<TagSummary> parse_summary(const nlohmann::json& j);

inline constexpr int max_team_size = 100;
inline constexpr int max_top_n = 50;

// Request body of the recommend endpoint: team_size in [1,100], top_n in
// [1,50] (default 10), optional tag lists.
std::expected<RecommendationRequest, Error> parse_request(const nlohmann::json& j);

double round4(double v);

} // namespace tagscout
