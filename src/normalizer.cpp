#include "tagscout/normalizer.hpp"
#include "tagscout/text.hpp"
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>

namespace tagscout {

namespace {

class TagSet {
public:
    void add(std::string_view raw) {
        auto tag = trim(raw);
        if (tag.empty()) return;
        if (seen_.insert(tag).second) ordered_.push_back(std::move(tag));
    }

    std::vector<std::string> take() { return std::move(ordered_); }

private:
    std::unordered_set<std::string> seen_;
    std::vector<std::string> ordered_;
};

std::vector<std::string> parse_json_tags(const std::string& text) {
    nlohmann::ordered_json parsed;
    try {
        parsed = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        return {};
    }

    TagSet tags;
    if (parsed.is_array()) {
        for (auto& element : parsed) {
            if (element.is_string()) tags.add(element.get<std::string>());
            else if (element.is_number()) tags.add(element.dump());
        }
    } else if (parsed.is_object()) {
        for (auto& [key, _] : parsed.items()) tags.add(key);
    }
    return tags.take();
}

// -- Date tokens --

struct DateToken {
    std::string text;
    bool numeric = false;
};

std::vector<DateToken> tokenize_date(const std::string& s) {
    std::vector<DateToken> tokens;
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isdigit(c) || std::isalpha(c)) {
            bool numeric = std::isdigit(c) != 0;
            size_t j = i;
            while (j < s.size()) {
                unsigned char d = static_cast<unsigned char>(s[j]);
                if (numeric ? !std::isdigit(d) : !std::isalpha(d)) break;
                ++j;
            }
            tokens.push_back({.text = s.substr(i, j - i), .numeric = numeric});
            i = j;
        } else {
            ++i;
        }
    }
    return tokens;
}

std::optional<int> month_from_name(const std::string& word) {
    static constexpr std::array<std::string_view, 12> names = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december",
    };
    if (word.size() < 3) return std::nullopt;
    auto lower = to_lower(word);
    for (size_t m = 0; m < names.size(); ++m) {
        if (names[m].starts_with(lower)) return static_cast<int>(m) + 1;
    }
    return std::nullopt;
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static constexpr std::array<int, 12> days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return days[month - 1];
}

std::optional<YearMonth> make_month(int year, int month, std::optional<int> day) {
    if (year < 1900 || year > 2999) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day && (*day < 1 || *day > days_in_month(year, month))) return std::nullopt;
    return YearMonth{.year = year, .month = month};
}

int to_int(const std::string& digits) {
    // Tokens are short digit runs; guard against overflow on junk input.
    if (digits.size() > 6) return -1;
    return std::atoi(digits.c_str());
}

} // namespace

std::vector<std::string> parse_tags(const std::string& raw) {
    auto text = trim(raw);
    if (text.empty()) return {};

    if (text.front() == '[' || text.front() == '{') {
        return parse_json_tags(text);
    }

    TagSet tags;
    size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        tags.add(std::string_view(text).substr(start, comma - start));
        start = comma + 1;
    }
    return tags.take();
}

std::optional<YearMonth> parse_release_month(const std::string& raw) {
    auto tokens = tokenize_date(trim(raw));
    if (tokens.empty()) return std::nullopt;

    std::optional<int> named_month;
    std::vector<const DateToken*> numbers;
    for (auto& t : tokens) {
        if (t.numeric) {
            numbers.push_back(&t);
        } else if (!named_month) {
            named_month = month_from_name(t.text);
        }
    }
    if (numbers.empty()) return std::nullopt;

    if (named_month) {
        // "Oct 21, 2008", "21 Oct, 2008", "October 2008"
        std::optional<int> year;
        std::optional<int> day;
        for (auto* n : numbers) {
            if (n->text.size() == 4) {
                year = to_int(n->text);
                break;
            }
            if (!day && n->text.size() <= 2) day = to_int(n->text);
        }
        if (!year) return std::nullopt;
        return make_month(*year, *named_month, day);
    }

    if (numbers[0]->text.size() == 4) {
        // "2008-10-21", "2008/10/21", "2008-10", "2008-10-21T00:00:00"
        if (numbers.size() < 2 || numbers[1]->text.size() > 2) return std::nullopt;
        std::optional<int> day;
        if (numbers.size() >= 3 && numbers[2]->text.size() <= 2) day = to_int(numbers[2]->text);
        return make_month(to_int(numbers[0]->text), to_int(numbers[1]->text), day);
    }

    if (numbers.size() >= 3 && numbers[2]->text.size() == 4 &&
        numbers[0]->text.size() <= 2 && numbers[1]->text.size() <= 2) {
        // Month-first unless the first field cannot be a month.
        int first = to_int(numbers[0]->text);
        int second = to_int(numbers[1]->text);
        int year = to_int(numbers[2]->text);
        if (first > 12 && second <= 12) std::swap(first, second);
        return make_month(year, first, second);
    }

    return std::nullopt;
}

int64_t parse_review_count(const std::optional<std::string>& raw) {
    if (!raw) return 0;
    auto text = trim(*raw);
    if (text.empty()) return 0;

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') return 0;
    if (!std::isfinite(value) || value < 0.0) return 0;
    if (value > 9.0e18) return 0;
    return static_cast<int64_t>(value);
}

GameRecord normalize_record(const RawGameRecord& raw, int64_t success_threshold) {
    GameRecord record;
    record.id = raw.id;
    record.name = raw.name;
    if (raw.tags) record.tags = parse_tags(*raw.tags);
    if (raw.release_date) record.release_month = parse_release_month(*raw.release_date);
    record.review_count = parse_review_count(raw.total_reviews);
    record.success = record.review_count >= success_threshold;
    return record;
}

std::vector<GameRecord> normalize_records(
    const std::vector<RawGameRecord>& raw, int64_t success_threshold) {

    std::vector<GameRecord> records;
    records.reserve(raw.size());
    for (auto& r : raw) {
        records.push_back(normalize_record(r, success_threshold));
    }
    return records;
}

} // namespace tagscout
