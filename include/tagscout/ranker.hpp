#pragma once

#include "tagscout/types.hpp"
#include <expected>
#include <string>
#include <unordered_map>
#include <vector>

namespace tagscout {

using ComplexityMap = std::unordered_map<std::string, int>;

// Exact match first, then case-insensitive; falls back to the default.
int lookup_complexity(const ComplexityMap& complexity, const std::string& tag,
                      int default_complexity);

std::expected<void, Error> validate_request(const RecommendationRequest& request);

// Candidates are known tags, restricted by allow_tags when given, minus
// avoid_tags. Sorted by score descending, then tag ascending.
std::expected<RecommendationResult, Error> recommend_tags(
    const std::vector<TagSummary>& summaries,
    const RecommendationRequest& request,
    const ComplexityMap& complexity,
    const ScoringConfig& config = {});

} // namespace tagscout
