#include <gtest/gtest.h>
#include "tagscout/display.hpp"

using namespace tagscout;

TEST(DisplayCsv, Timeseries) {
    std::vector<TimeseriesPoint> points = {
        {.month = {2023, 1}, .released_count = 12, .success_rate = 0.25},
        {.month = {2023, 2}, .released_count = 15, .success_rate = 1.0 / 3.0},
    };
    EXPECT_EQ(timeseries_csv(points),
              "year_month,released_count,success_rate\n"
              "2023-01,12,0.250\n"
              "2023-02,15,0.333\n");
}

TEST(DisplayCsv, RecommendationsQuoteAndJoinReasons) {
    Recommendation r;
    r.tag = "Co-op, Local";
    r.score = 0.512;
    r.trend_score = -0.05;
    r.released_last_6m = 7;
    r.complexity = 4;
    r.complexity_penalty = 0.22;
    r.reasons = {"Low saturation", "Matches preferred tag"};

    RecommendationResult result{.recommendations = {r}, .data_last_month = "2023-02",
                                .unique_tags = 1};
    EXPECT_EQ(recommendations_csv(result),
              "rank,tag,score,recent_success_rate_24m,trend_score,released_last_6m,"
              "complexity,complexity_penalty,reasons\n"
              "1,\"Co-op, Local\",0.512,,-0.050,7,4,0.220,"
              "Low saturation; Matches preferred tag\n");
}

TEST(DisplayCsv, EmptyRecommendationsIsHeaderOnly) {
    EXPECT_EQ(recommendations_csv({}),
              "rank,tag,score,recent_success_rate_24m,trend_score,released_last_6m,"
              "complexity,complexity_penalty,reasons\n");
}
