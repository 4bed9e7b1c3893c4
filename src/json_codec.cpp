#include "tagscout/json_codec.hpp"
#include <cmath>

namespace tagscout {

namespace {

std::optional<int> safe_int(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_integer()) return j[key].get<int>();
    return std::nullopt;
}

std::optional<std::string> safe_str(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<double> safe_double(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return std::nullopt;
}

std::optional<YearMonth> safe_month(const nlohmann::json& j, const std::string& key) {
    auto text = safe_str(j, key);
    if (!text) return std::nullopt;
    return parse_year_month(*text);
}

std::unexpected<Error> invalid(const std::string& message) {
    return std::unexpected(Error{ErrorKind::InvalidRequest, message});
}

std::expected<std::vector<std::string>, Error> string_list(
    const nlohmann::json& j, const std::string& key) {

    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    if (!j[key].is_array()) return invalid(key + " must be an array of strings");

    for (auto& v : j[key]) {
        if (!v.is_string()) return invalid(key + " must be an array of strings");
        out.push_back(v.get<std::string>());
    }
    return out;
}

std::expected<int, Error> bounded_int(const nlohmann::json& j, const std::string& key,
                                      std::optional<int> fallback, int lo, int hi) {
    if (!j.contains(key) || j[key].is_null()) {
        if (fallback) return *fallback;
        return invalid(key + " is required");
    }
    if (!j[key].is_number_integer()) return invalid(key + " must be an integer");

    auto v = j[key].get<int64_t>();
    if (v < lo || v > hi) {
        return invalid(key + " must be between " + std::to_string(lo) +
                       " and " + std::to_string(hi));
    }
    return static_cast<int>(v);
}

nlohmann::json optional_rate(const std::optional<double>& v) {
    if (!v) return nullptr;
    return round4(*v);
}

} // namespace

double round4(double v) {
    return std::round(v * 10000.0) / 10000.0;
}

void to_json(nlohmann::json& j, const MonthlyTagBucket& b) {
    j = {
        {"tag", b.tag},
        {"year_month", b.month.to_string()},
        {"released_count", b.released_count},
        {"success_count", b.success_count},
    };
    if (auto rate = b.success_rate()) j["success_rate"] = *rate;
    else j["success_rate"] = nullptr;
}

void to_json(nlohmann::json& j, const TagSummary& s) {
    j = {
        {"tag", s.tag},
        {"released_last_6m", s.released_last_6m},
        {"trend_score", s.trend_score},
        {"last_month", s.last_month.to_string()},
    };
    if (s.recent_success_rate_24m) j["recent_success_rate_24m"] = *s.recent_success_rate_24m;
    else j["recent_success_rate_24m"] = nullptr;
}

void to_json(nlohmann::json& j, const TimeseriesPoint& p) {
    j = {
        {"year_month", p.month.to_string()},
        {"released_count", p.released_count},
        {"success_rate", round4(p.success_rate)},
    };
}

void to_json(nlohmann::json& j, const Recommendation& r) {
    j = {
        {"tag", r.tag},
        {"score", round4(r.score)},
        {"recent_success_rate_24m", optional_rate(r.recent_success_rate_24m)},
        {"trend_score", round4(r.trend_score)},
        {"released_last_6m", r.released_last_6m},
        {"complexity_score", r.complexity},
        {"complexity_penalty", round4(r.complexity_penalty)},
        {"components", {
            {"success", round4(r.success_term)},
            {"trend", round4(r.trend_term)},
            {"saturation", round4(r.saturation_term)},
            {"preference", round4(r.preference_term)},
        }},
        {"reasons", r.reasons},
    };
}

void to_json(nlohmann::json& j, const RecommendationRequest& r) {
    j = {
        {"team_size", r.team_size},
        {"top_n", r.top_n},
        {"prefer_tags", r.prefer_tags},
        {"avoid_tags", r.avoid_tags},
    };
    if (r.allow_tags) j["allow_tags"] = *r.allow_tags;
    else j["allow_tags"] = nullptr;
}

std::optional<MonthlyTagBucket> parse_bucket(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto tag = safe_str(j, "tag");
    auto month = safe_month(j, "year_month");
    auto released = safe_int(j, "released_count");
    auto successes = safe_int(j, "success_count");
    if (!tag || !month || !released || !successes) return std::nullopt;
    if (*released <= 0 || *successes < 0 || *successes > *released) return std::nullopt;

    return MonthlyTagBucket{
        .tag = *tag,
        .month = *month,
        .released_count = *released,
        .success_count = *successes,
    };
}

std::optional<TagSummary> parse_summary(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto tag = safe_str(j, "tag");
    auto last = safe_month(j, "last_month");
    auto released = safe_int(j, "released_last_6m");
    auto trend = safe_double(j, "trend_score");
    if (!tag || !last || !released || !trend) return std::nullopt;

    return TagSummary{
        .tag = *tag,
        .recent_success_rate_24m = safe_double(j, "recent_success_rate_24m"),
        .released_last_6m = *released,
        .trend_score = *trend,
        .last_month = *last,
    };
}

std::expected<RecommendationRequest, Error> parse_request(const nlohmann::json& j) {
    if (!j.is_object()) return invalid("request body must be a JSON object");

    RecommendationRequest req;

    auto team_size = bounded_int(j, "team_size", std::nullopt, 1, max_team_size);
    if (!team_size) return std::unexpected(team_size.error());
    req.team_size = *team_size;

    auto top_n = bounded_int(j, "top_n", 10, 1, max_top_n);
    if (!top_n) return std::unexpected(top_n.error());
    req.top_n = *top_n;

    auto prefer = string_list(j, "prefer_tags");
    if (!prefer) return std::unexpected(prefer.error());
    req.prefer_tags = std::move(*prefer);

    auto avoid = string_list(j, "avoid_tags");
    if (!avoid) return std::unexpected(avoid.error());
    req.avoid_tags = std::move(*avoid);

    if (j.contains("allow_tags") && !j["allow_tags"].is_null()) {
        auto allow = string_list(j, "allow_tags");
        if (!allow) return std::unexpected(allow.error());
        req.allow_tags = std::move(*allow);
    }

    return req;
}

} // namespace tagscout
