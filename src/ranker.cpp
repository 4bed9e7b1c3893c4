#include "tagscout/ranker.hpp"
#include "tagscout/scorer.hpp"
#include "tagscout/text.hpp"
#include <algorithm>
#include <unordered_set>

namespace tagscout {

namespace {

std::unordered_set<std::string> key_set(const std::vector<std::string>& tags) {
    std::unordered_set<std::string> keys;
    for (auto& t : tags) keys.insert(tag_key(t));
    return keys;
}

std::expected<void, Error> check_tag_list(const std::vector<std::string>& tags,
                                          const std::string& field) {
    for (auto& t : tags) {
        if (trim(t).empty()) {
            return std::unexpected(Error{ErrorKind::InvalidRequest,
                                         field + " contains a blank tag"});
        }
    }
    return {};
}

} // namespace

int lookup_complexity(const ComplexityMap& complexity, const std::string& tag,
                      int default_complexity) {
    if (auto it = complexity.find(tag); it != complexity.end()) return it->second;

    // Several spellings may fold to the same key; the smallest name wins.
    auto key = tag_key(tag);
    const std::string* best = nullptr;
    int value = default_complexity;
    for (auto& [name, c] : complexity) {
        if (tag_key(name) != key) continue;
        if (!best || name < *best) {
            best = &name;
            value = c;
        }
    }
    return value;
}

std::expected<void, Error> validate_request(const RecommendationRequest& request) {
    if (request.team_size <= 0) {
        return std::unexpected(Error{ErrorKind::InvalidRequest,
                                     "team_size must be positive"});
    }
    if (request.top_n <= 0) {
        return std::unexpected(Error{ErrorKind::InvalidRequest,
                                     "top_n must be positive"});
    }
    if (auto r = check_tag_list(request.prefer_tags, "prefer_tags"); !r) return r;
    if (auto r = check_tag_list(request.avoid_tags, "avoid_tags"); !r) return r;
    if (request.allow_tags) {
        if (auto r = check_tag_list(*request.allow_tags, "allow_tags"); !r) return r;
    }
    return {};
}

std::expected<RecommendationResult, Error> recommend_tags(
    const std::vector<TagSummary>& summaries,
    const RecommendationRequest& request,
    const ComplexityMap& complexity,
    const ScoringConfig& config) {

    if (auto valid = validate_request(request); !valid) {
        return std::unexpected(valid.error());
    }

    auto avoid = key_set(request.avoid_tags);
    std::optional<std::unordered_set<std::string>> allow;
    if (request.allow_tags) allow = key_set(*request.allow_tags);

    RecommendationResult result;
    std::optional<YearMonth> last_month;

    for (auto& s : summaries) {
        auto key = tag_key(s.tag);
        if (allow && !allow->contains(key)) continue;
        if (avoid.contains(key)) continue;

        int c = lookup_complexity(complexity, trim(s.tag), config.default_complexity);
        result.recommendations.push_back(score_tag(s, c, request, config));

        if (!last_month || s.last_month > *last_month) last_month = s.last_month;
    }

    result.unique_tags = static_cast<int>(result.recommendations.size());
    if (last_month) result.data_last_month = last_month->to_string();

    std::ranges::sort(result.recommendations, [](const Recommendation& a, const Recommendation& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.tag < b.tag;
    });

    if (static_cast<int>(result.recommendations.size()) > request.top_n) {
        result.recommendations.resize(request.top_n);
    }

    return result;
}

} // namespace tagscout
