#include "tagscout/analytics.hpp"
#include "tagscout/text.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace tagscout {

namespace {

struct WindowMean {
    double sum = 0.0;
    int count = 0;

    void add(double v) {
        sum += v;
        count++;
    }

    std::optional<double> mean() const {
        if (count == 0) return std::nullopt;
        return sum / count;
    }
};

} // namespace

std::vector<MonthlyTagBucket> build_month_stats(
    const std::vector<GameRecord>& records) {

    struct Counts {
        int released = 0;
        int successes = 0;
    };

    std::map<std::pair<std::string, YearMonth>, Counts> by_key;

    for (auto& r : records) {
        if (!r.release_month) continue;
        for (auto& tag : r.tags) {
            auto& c = by_key[{tag, *r.release_month}];
            c.released++;
            if (r.success) c.successes++;
        }
    }

    std::vector<MonthlyTagBucket> result;
    result.reserve(by_key.size());
    for (auto& [key, counts] : by_key) {
        result.push_back({
            .tag = key.first,
            .month = key.second,
            .released_count = counts.released,
            .success_count = counts.successes,
        });
    }

    return result;
}

std::optional<YearMonth> max_month(const std::vector<MonthlyTagBucket>& buckets) {
    if (buckets.empty()) return std::nullopt;
    return std::ranges::max_element(buckets, {}, &MonthlyTagBucket::month)->month;
}

std::vector<TagSummary> summarize_tags(
    const std::vector<MonthlyTagBucket>& buckets) {

    auto latest = max_month(buckets);
    if (!latest) return {};
    const int anchor = latest->index();

    std::map<std::string, std::vector<const MonthlyTagBucket*>> by_tag;
    for (auto& b : buckets) {
        by_tag[b.tag].push_back(&b);
    }

    std::vector<TagSummary> result;
    result.reserve(by_tag.size());

    for (auto& [tag, tag_buckets] : by_tag) {
        std::ranges::sort(tag_buckets, {}, [](const MonthlyTagBucket* b) { return b->month; });

        WindowMean success_24m;
        WindowMean recent;
        WindowMean prior;
        int released_6m = 0;

        for (auto* b : tag_buckets) {
            int age = anchor - b->month.index();
            auto rate = b->success_rate();

            if (age < success_window_months && rate) success_24m.add(*rate);
            if (age < volume_window_months) released_6m += b->released_count;

            if (!rate) continue;
            if (age < trend_recent_months) {
                recent.add(*rate);
            } else if (age < trend_recent_months + trend_prior_months) {
                prior.add(*rate);
            }
        }

        result.push_back({
            .tag = tag,
            .recent_success_rate_24m = success_24m.mean(),
            .released_last_6m = released_6m,
            .trend_score = recent.mean().value_or(0.0) - prior.mean().value_or(0.0),
            .last_month = tag_buckets.back()->month,
        });
    }

    return result;
}

std::vector<TimeseriesPoint> tag_timeseries(
    const std::string& tag, const std::vector<MonthlyTagBucket>& buckets) {

    auto key = tag_key(tag);
    std::vector<TimeseriesPoint> points;
    for (auto& b : buckets) {
        if (tag_key(b.tag) != key) continue;
        points.push_back({
            .month = b.month,
            .released_count = b.released_count,
            .success_rate = b.success_rate().value_or(0.0),
        });
    }

    // Two spellings of one tag can share a month; keep a stable order.
    std::ranges::stable_sort(points, {}, &TimeseriesPoint::month);
    return points;
}

std::vector<std::string> list_tags(const std::vector<TagSummary>& summaries) {
    std::set<std::string> tags;
    for (auto& s : summaries) {
        auto t = trim(s.tag);
        if (!t.empty()) tags.insert(std::move(t));
    }
    return {tags.begin(), tags.end()};
}

} // namespace tagscout
