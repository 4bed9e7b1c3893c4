#include "tagscout/scorer.hpp"
#include "tagscout/text.hpp"
#include <algorithm>
#include <cmath>

namespace tagscout {

namespace {

bool contains_tag(const std::vector<std::string>& tags, const std::string& key) {
    return std::ranges::any_of(tags, [&](const std::string& t) { return tag_key(t) == key; });
}

ReasonRule fixed(std::function<bool(const ReasonInputs&)> applies, std::string text) {
    return {
        .applies = std::move(applies),
        .message = [text = std::move(text)](const ReasonInputs&) { return text; },
    };
}

std::vector<std::vector<ReasonRule>> make_rules() {
    std::vector<std::vector<ReasonRule>> groups;

    groups.push_back({
        fixed([](auto& in) { return !in.recent_success_rate_24m.has_value(); },
              "No recent success data (last 24 months)"),
        fixed([](auto& in) { return *in.recent_success_rate_24m >= 0.3; },
              "High recent success rate"),
        fixed([](auto& in) { return *in.recent_success_rate_24m >= 0.15; },
              "Moderate recent success rate"),
        fixed([](auto&) { return true; }, "Low recent success rate"),
    });

    groups.push_back({
        fixed([](auto& in) { return in.trend_score > 0.1; }, "Strong positive trend"),
        fixed([](auto& in) { return in.trend_score > 0.0; }, "Positive trend"),
        fixed([](auto& in) { return in.trend_score < -0.1; }, "Negative trend"),
    });

    groups.push_back({
        fixed([](auto& in) { return in.released_last_6m >= 50; },
              "High saturation (many recent releases)"),
        fixed([](auto& in) { return in.released_last_6m >= 20; }, "Moderate saturation"),
        fixed([](auto&) { return true; }, "Low saturation"),
    });

    groups.push_back({
        {
            .applies = [](auto& in) { return in.complexity_penalty > 0.0; },
            .message = [](auto& in) {
                return "Penalized for small team (size " + std::to_string(in.team_size) +
                       ") vs high complexity (score " + std::to_string(in.complexity) + ")";
            },
        },
        fixed([](auto& in) { return in.complexity >= 4 && in.team_size < 6; },
              "Moderate complexity for team size"),
        fixed([](auto&) { return true; }, "Good complexity match for team size"),
    });

    groups.push_back({
        fixed([](auto& in) { return in.preferred; }, "Matches preferred tag"),
    });

    return groups;
}

} // namespace

const ComplexityTier& tier_for_team(int team_size) {
    for (auto& tier : complexity_tiers) {
        if (team_size <= tier.max_team_size) return tier;
    }
    return complexity_tiers.back();
}

double complexity_penalty(int team_size, int complexity) {
    auto& tier = tier_for_team(team_size);
    if (tier.coefficient == 0.0) return 0.0;
    return tier.coefficient * std::max(0, complexity - tier.threshold);
}

const std::vector<std::vector<ReasonRule>>& reason_rules() {
    static const auto rules = make_rules();
    return rules;
}

std::vector<std::string> generate_reasons(const ReasonInputs& in) {
    std::vector<std::string> reasons;
    for (auto& group : reason_rules()) {
        for (auto& rule : group) {
            if (rule.applies(in)) {
                reasons.push_back(rule.message(in));
                break;
            }
        }
    }
    return reasons;
}

Recommendation score_tag(const TagSummary& summary, int complexity,
                         const RecommendationRequest& request,
                         const ScoringConfig& config) {

    Recommendation rec;
    rec.tag = summary.tag;
    rec.recent_success_rate_24m = summary.recent_success_rate_24m;
    rec.trend_score = summary.trend_score;
    rec.released_last_6m = summary.released_last_6m;
    rec.complexity = complexity;

    bool preferred = contains_tag(request.prefer_tags, tag_key(summary.tag));

    rec.success_term = config.w_success * summary.recent_success_rate_24m.value_or(0.0);
    rec.trend_term = config.w_trend * summary.trend_score;
    rec.saturation_term = -config.w_saturation *
                          std::log(1.0 + std::max(0, summary.released_last_6m));
    rec.complexity_penalty = complexity_penalty(request.team_size, complexity);
    rec.preference_term = preferred ? config.prefer_bonus : 0.0;

    rec.score = rec.success_term + rec.trend_term + rec.saturation_term
              - rec.complexity_penalty + rec.preference_term;

    rec.reasons = generate_reasons({
        .recent_success_rate_24m = summary.recent_success_rate_24m,
        .trend_score = summary.trend_score,
        .released_last_6m = summary.released_last_6m,
        .complexity_penalty = rec.complexity_penalty,
        .team_size = request.team_size,
        .complexity = complexity,
        .preferred = preferred,
    });

    return rec;
}

} // namespace tagscout
