#include <gtest/gtest.h>
#include "tagscout/normalizer.hpp"

using namespace tagscout;

namespace {

RawGameRecord make_raw(std::optional<std::string> tags,
                       std::optional<std::string> date,
                       std::optional<std::string> reviews) {
    return {
        .id = "1",
        .name = "Game",
        .tags = std::move(tags),
        .release_date = std::move(date),
        .total_reviews = std::move(reviews),
    };
}

} // namespace

TEST(ParseTags, JsonArray) {
    auto tags = parse_tags(R"(["Indie", "Roguelike", "Action"])");
    std::vector<std::string> expected = {"Indie", "Roguelike", "Action"};
    EXPECT_EQ(tags, expected);
}

TEST(ParseTags, CommaSeparatedTrimsAndDropsEmpty) {
    auto tags = parse_tags(" Indie ,  Puzzle,, ,Casual ");
    std::vector<std::string> expected = {"Indie", "Puzzle", "Casual"};
    EXPECT_EQ(tags, expected);
}

TEST(ParseTags, DeduplicatesKeepingFirstOccurrence) {
    auto tags = parse_tags("RPG, Indie, RPG, Strategy, Indie");
    std::vector<std::string> expected = {"RPG", "Indie", "Strategy"};
    EXPECT_EQ(tags, expected);
}

TEST(ParseTags, PreservesCase) {
    auto tags = parse_tags("rpg, RPG");
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0], "rpg");
    EXPECT_EQ(tags[1], "RPG");
}

TEST(ParseTags, JsonObjectKeysInDocumentOrder) {
    auto tags = parse_tags(R"({"Survival": 120, "Crafting": 80, "Open World": 40})");
    std::vector<std::string> expected = {"Survival", "Crafting", "Open World"};
    EXPECT_EQ(tags, expected);
}

TEST(ParseTags, MalformedJsonYieldsEmpty) {
    EXPECT_TRUE(parse_tags(R"(["Indie", "RPG")").empty());
    EXPECT_TRUE(parse_tags("[not json").empty());
}

TEST(ParseTags, JsonArraySkipsNullAndBlankElements) {
    auto tags = parse_tags(R"(["Indie", null, "  ", " Horror "])");
    std::vector<std::string> expected = {"Indie", "Horror"};
    EXPECT_EQ(tags, expected);
}

TEST(ParseTags, EmptyInput) {
    EXPECT_TRUE(parse_tags("").empty());
    EXPECT_TRUE(parse_tags("   ").empty());
    EXPECT_TRUE(parse_tags("[]").empty());
}

TEST(ParseReleaseMonth, IsoDate) {
    auto m = parse_release_month("2023-02-17");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->year, 2023);
    EXPECT_EQ(m->month, 2);
}

TEST(ParseReleaseMonth, SlashAndTimestampForms) {
    EXPECT_EQ(parse_release_month("2021/11/03"), (YearMonth{2021, 11}));
    EXPECT_EQ(parse_release_month("2019-10-21T08:30:00"), (YearMonth{2019, 10}));
    EXPECT_EQ(parse_release_month("2020-07"), (YearMonth{2020, 7}));
}

TEST(ParseReleaseMonth, SteamStyleDates) {
    EXPECT_EQ(parse_release_month("Oct 21, 2008"), (YearMonth{2008, 10}));
    EXPECT_EQ(parse_release_month("21 Oct, 2008"), (YearMonth{2008, 10}));
    EXPECT_EQ(parse_release_month("September 2015"), (YearMonth{2015, 9}));
    EXPECT_EQ(parse_release_month("Sept 5, 2015"), (YearMonth{2015, 9}));
}

TEST(ParseReleaseMonth, NumericMonthFirstUnlessImpossible) {
    EXPECT_EQ(parse_release_month("03/04/2022"), (YearMonth{2022, 3}));
    EXPECT_EQ(parse_release_month("25/04/2022"), (YearMonth{2022, 4}));
}

TEST(ParseReleaseMonth, RejectsUnparseable) {
    EXPECT_FALSE(parse_release_month("").has_value());
    EXPECT_FALSE(parse_release_month("Coming soon").has_value());
    EXPECT_FALSE(parse_release_month("TBA").has_value());
    EXPECT_FALSE(parse_release_month("2022-13-01").has_value());
    EXPECT_FALSE(parse_release_month("Feb 30, 2021").has_value());
}

TEST(ParseReleaseMonth, LeapDay) {
    EXPECT_EQ(parse_release_month("2024-02-29"), (YearMonth{2024, 2}));
    EXPECT_FALSE(parse_release_month("2023-02-29").has_value());
}

TEST(ParseReviewCount, CoercesText) {
    EXPECT_EQ(parse_review_count(std::string("150")), 150);
    EXPECT_EQ(parse_review_count(std::string("99.9")), 99);
    EXPECT_EQ(parse_review_count(std::string(" 42 ")), 42);
    EXPECT_EQ(parse_review_count(std::string("n/a")), 0);
    EXPECT_EQ(parse_review_count(std::string("-5")), 0);
    EXPECT_EQ(parse_review_count(std::nullopt), 0);
}

TEST(NormalizeRecord, SuccessAtThreshold) {
    EXPECT_TRUE(normalize_record(make_raw("Indie", "2023-01-01", "100")).success);
    EXPECT_FALSE(normalize_record(make_raw("Indie", "2023-01-01", "99")).success);
}

TEST(NormalizeRecord, MissingReviewsIsNotSuccess) {
    auto r = normalize_record(make_raw("Indie", "2023-01-01", std::nullopt));
    EXPECT_EQ(r.review_count, 0);
    EXPECT_FALSE(r.success);
}

TEST(NormalizeRecord, CustomThreshold) {
    auto r = normalize_record(make_raw("Indie", "2023-01-01", "20"), 10);
    EXPECT_TRUE(r.success);
}

TEST(NormalizeRecord, MalformedFieldsDegradeLocally) {
    auto r = normalize_record(make_raw("[broken", "someday", "500"));
    EXPECT_TRUE(r.tags.empty());
    EXPECT_FALSE(r.release_month.has_value());
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.id, "1");
}

TEST(NormalizeRecords, BatchKeepsEveryRecord) {
    std::vector<RawGameRecord> raw = {
        make_raw(R"(["Indie"])", "2023-01-05", "10"),
        make_raw("[oops", "2023-01-05", "200"),
        make_raw(std::nullopt, std::nullopt, std::nullopt),
    };
    auto records = normalize_records(raw);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].tags.size(), 1u);
    EXPECT_TRUE(records[1].tags.empty());
    EXPECT_TRUE(records[2].tags.empty());
    EXPECT_FALSE(records[2].release_month.has_value());
}
