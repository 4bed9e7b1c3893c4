#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tagscout {

struct YearMonth {
    int year = 0;
    int month = 1; // 1..12

    int index() const { return year * 12 + (month - 1); }

    static YearMonth from_index(int idx) {
        return {.year = idx / 12, .month = idx % 12 + 1};
    }

    std::string to_string() const;

    auto operator<=>(const YearMonth&) const = default;
};

std::optional<YearMonth> parse_year_month(const std::string& s);

struct RawGameRecord {
    std::string id;
    std::string name;
    std::optional<std::string> tags;
    std::optional<std::string> release_date;
    std::optional<std::string> total_reviews;
};

struct GameRecord {
    std::string id;
    std::string name;
    std::vector<std::string> tags;
    std::optional<YearMonth> release_month;
    int64_t review_count = 0;
    bool success = false;
};

struct MonthlyTagBucket {
    std::string tag;
    YearMonth month;
    int released_count = 0;
    int success_count = 0;

    std::optional<double> success_rate() const {
        if (released_count <= 0) return std::nullopt;
        return static_cast<double>(success_count) / released_count;
    }
};

struct TagSummary {
    std::string tag;
    std::optional<double> recent_success_rate_24m;
    int released_last_6m = 0;
    double trend_score = 0.0;
    YearMonth last_month;
};

struct TimeseriesPoint {
    YearMonth month;
    int released_count = 0;
    double success_rate = 0.0;
};

struct RecommendationRequest {
    int team_size = 1;
    int top_n = 10;
    std::vector<std::string> prefer_tags;
    std::vector<std::string> avoid_tags;
    std::optional<std::vector<std::string>> allow_tags;
};

struct Recommendation {
    std::string tag;
    double score = 0.0;

    // Score components
    double success_term = 0.0;
    double trend_term = 0.0;
    double saturation_term = 0.0;
    double preference_term = 0.0;

    // Summary inputs the components were derived from
    std::optional<double> recent_success_rate_24m;
    double trend_score = 0.0;
    int released_last_6m = 0;

    int complexity = 0;
    double complexity_penalty = 0.0;
    std::vector<std::string> reasons;
};

struct RecommendationResult {
    std::vector<Recommendation> recommendations;
    std::string data_last_month;
    int unique_tags = 0;
};

struct ScoringConfig {
    double w_success = 1.0;
    double w_trend = 0.7;
    double w_saturation = 0.15;
    double prefer_bonus = 0.05;
    int default_complexity = 3;
};

enum class ErrorKind {
    DataNotReady,
    InvalidRequest,
    Io,
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
};

std::string to_string(ErrorKind kind);

} // namespace tagscout
