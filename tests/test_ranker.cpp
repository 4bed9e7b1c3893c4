#include <gtest/gtest.h>
#include "tagscout/ranker.hpp"
#include <algorithm>

using namespace tagscout;

namespace {

TagSummary make_summary(const std::string& tag, double rate, double trend = 0.0,
                        int released = 0, YearMonth last = {2023, 2}) {
    return {
        .tag = tag,
        .recent_success_rate_24m = rate,
        .released_last_6m = released,
        .trend_score = trend,
        .last_month = last,
    };
}

std::vector<TagSummary> sample_summaries() {
    return {
        make_summary("Roguelike", 0.40, 0.05, 12),
        make_summary("MMO", 0.50, 0.00, 3),
        make_summary("Puzzle", 0.20, 0.10, 30, {2022, 11}),
        make_summary("Horror", 0.30, -0.2, 8),
        make_summary("Casual", 0.10, 0.00, 60),
    };
}

RecommendationRequest request(int team_size, int top_n) {
    RecommendationRequest r;
    r.team_size = team_size;
    r.top_n = top_n;
    return r;
}

std::vector<std::string> tags_of(const RecommendationResult& result) {
    std::vector<std::string> out;
    for (auto& r : result.recommendations) out.push_back(r.tag);
    return out;
}

} // namespace

TEST(Ranker, SortedDescendingAndTruncated) {
    auto result = recommend_tags(sample_summaries(), request(6, 3), {});
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->recommendations.size(), 3u);
    for (size_t i = 1; i < result->recommendations.size(); ++i) {
        EXPECT_GE(result->recommendations[i - 1].score, result->recommendations[i].score);
    }
    EXPECT_EQ(result->unique_tags, 5);
    EXPECT_EQ(result->data_last_month, "2023-02");
}

TEST(Ranker, TiesBrokenByTagAscending) {
    std::vector<TagSummary> rows = {
        make_summary("Zeta", 0.3), make_summary("Alpha", 0.3), make_summary("Mid", 0.3),
    };
    auto result = recommend_tags(rows, request(6, 10), {});
    ASSERT_TRUE(result.has_value());
    std::vector<std::string> expected = {"Alpha", "Mid", "Zeta"};
    EXPECT_EQ(tags_of(*result), expected);
}

TEST(Ranker, TopNLargerThanCandidatesReturnsAll) {
    auto result = recommend_tags(sample_summaries(), request(2, 50), {});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->recommendations.size(), 5u);
}

TEST(Ranker, AvoidOverridesPrefer) {
    auto req = request(2, 10);
    req.avoid_tags = {"MMO"};
    req.prefer_tags = {"MMO"};
    auto result = recommend_tags(sample_summaries(), req, {});
    ASSERT_TRUE(result.has_value());
    for (auto& r : result->recommendations) EXPECT_NE(r.tag, "MMO");
    EXPECT_EQ(result->unique_tags, 4);
}

TEST(Ranker, FiltersAreCaseInsensitive) {
    auto req = request(2, 10);
    req.avoid_tags = {"mmo ", "HORROR"};
    auto result = recommend_tags(sample_summaries(), req, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->recommendations.size(), 3u);
}

TEST(Ranker, AllowRestrictsCandidates) {
    auto req = request(2, 10);
    req.allow_tags = std::vector<std::string>{"puzzle", "Horror", "Platformer"};
    auto result = recommend_tags(sample_summaries(), req, {});
    ASSERT_TRUE(result.has_value());
    std::vector<std::string> expected = {"Horror", "Puzzle"};
    auto tags = tags_of(*result);
    std::ranges::sort(tags);
    EXPECT_EQ(tags, expected);
    EXPECT_EQ(result->data_last_month, "2023-02");
}

TEST(Ranker, AllowUnknownTagGivesEmptyResult) {
    auto req = request(2, 10);
    req.allow_tags = std::vector<std::string>{"Indie"};
    auto result = recommend_tags(sample_summaries(), req, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->recommendations.empty());
    EXPECT_EQ(result->unique_tags, 0);
    EXPECT_EQ(result->data_last_month, "");
}

TEST(Ranker, EmptySummaryTableGivesEmptyResult) {
    auto result = recommend_tags({}, request(2, 10), {});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->recommendations.empty());
}

TEST(Ranker, ComplexityChangesOrdering) {
    std::vector<TagSummary> rows = {make_summary("Simple", 0.30), make_summary("MMO", 0.50)};
    ComplexityMap complexity = {{"MMO", 5}, {"Simple", 1}};

    auto solo = recommend_tags(rows, request(1, 10), complexity);
    ASSERT_TRUE(solo.has_value());
    EXPECT_EQ(solo->recommendations.front().tag, "Simple");
    EXPECT_EQ(solo->recommendations.back().complexity, 5);

    auto studio = recommend_tags(rows, request(8, 10), complexity);
    ASSERT_TRUE(studio.has_value());
    EXPECT_EQ(studio->recommendations.front().tag, "MMO");
}

TEST(Ranker, UnmappedTagsUseDefaultComplexity) {
    ScoringConfig cfg;
    cfg.default_complexity = 4;
    auto result = recommend_tags({make_summary("Odd", 0.3)}, request(2, 10), {}, cfg);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->recommendations[0].complexity, 4);
    EXPECT_DOUBLE_EQ(result->recommendations[0].complexity_penalty, 0.22);
}

TEST(Ranker, RejectsNonPositiveTeamSize) {
    auto result = recommend_tags(sample_summaries(), request(0, 10), {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRequest);
}

TEST(Ranker, RejectsNonPositiveTopN) {
    auto result = recommend_tags(sample_summaries(), request(3, 0), {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRequest);
}

TEST(Ranker, EmptyAllowListGivesEmptyResult) {
    auto req = request(3, 5);
    req.allow_tags = std::vector<std::string>{};
    auto result = recommend_tags(sample_summaries(), req, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->recommendations.empty());
    EXPECT_EQ(result->unique_tags, 0);
    EXPECT_EQ(result->data_last_month, "");
}

TEST(Ranker, RejectsBlankTagNames) {
    auto req = request(3, 5);
    req.avoid_tags = {"  "};
    auto result = recommend_tags(sample_summaries(), req, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRequest);
}

TEST(LookupComplexity, ExactThenCaseInsensitive) {
    ComplexityMap complexity = {{"Open World", 5}};
    EXPECT_EQ(lookup_complexity(complexity, "Open World", 3), 5);
    EXPECT_EQ(lookup_complexity(complexity, "open world", 3), 5);
    EXPECT_EQ(lookup_complexity(complexity, "Puzzle", 3), 3);
}

TEST(LookupComplexity, CaseVariantsResolveToSmallestName) {
    ComplexityMap complexity = {{"indie ", 1}, {"INDIE", 5}, {"Indie  ", 2}};
    EXPECT_EQ(lookup_complexity(complexity, "indie", 3), 5);

    ComplexityMap reordered = {{"INDIE", 5}, {"Indie  ", 2}, {"indie ", 1}};
    EXPECT_EQ(lookup_complexity(reordered, "indie", 3), 5);

    // An exact spelling still beats the fallback.
    EXPECT_EQ(lookup_complexity(complexity, "indie ", 3), 1);
}
