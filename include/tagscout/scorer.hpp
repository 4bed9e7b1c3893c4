#pragma once

#include "tagscout/types.hpp"
#include <array>
#include <functional>
#include <limits>
#include <string>
#include <vector>

namespace tagscout {

struct ComplexityTier {
    int max_team_size = 0;  // inclusive upper bound
    double coefficient = 0.0;
    int threshold = 0;
};

// Ordered by max_team_size; the first tier that fits the team applies.
inline constexpr std::array<ComplexityTier, 4> complexity_tiers = {{
    {.max_team_size = 1, .coefficient = 0.35, .threshold = 2},
    {.max_team_size = 3, .coefficient = 0.22, .threshold = 3},
    {.max_team_size = 5, .coefficient = 0.12, .threshold = 4},
    {.max_team_size = std::numeric_limits<int>::max(), .coefficient = 0.0, .threshold = 0},
}};

const ComplexityTier& tier_for_team(int team_size);

double complexity_penalty(int team_size, int complexity);

struct ReasonInputs {
    std::optional<double> recent_success_rate_24m;
    double trend_score = 0.0;
    int released_last_6m = 0;
    double complexity_penalty = 0.0;
    int team_size = 1;
    int complexity = 0;
    bool preferred = false;
};

struct ReasonRule {
    std::function<bool(const ReasonInputs&)> applies;
    std::function<std::string(const ReasonInputs&)> message;
};

// Groups are evaluated in order (success, trend, saturation, complexity,
// preference). Within a group the first matching rule wins; a group may
// contribute nothing.
const std::vector<std::vector<ReasonRule>>& reason_rules();

std::vector<std::string> generate_reasons(const ReasonInputs& in);

Recommendation score_tag(const TagSummary& summary, int complexity,
                         const RecommendationRequest& request,
                         const ScoringConfig& config = {});

} // namespace tagscout
