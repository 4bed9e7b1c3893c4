#include "tagscout/pipeline.hpp"
#include "tagscout/analytics.hpp"
#include <spdlog/spdlog.h>

namespace tagscout {

Pipeline::Pipeline(int64_t success_threshold)
    : success_threshold_(success_threshold) {}

void Pipeline::normalize(const std::vector<RawGameRecord>& raw) {
    records_ = normalize_records(raw, success_threshold_);
    buckets_.reset();
    summaries_.reset();

    int dated = 0;
    int successes = 0;
    for (auto& r : *records_) {
        if (r.release_month) dated++;
        if (r.success) successes++;
    }
    spdlog::info("Normalized {} records ({} with release month, {} successful)",
                 records_->size(), dated, successes);
}

std::expected<void, Error> Pipeline::aggregate() {
    if (!records_) {
        return std::unexpected(Error{ErrorKind::DataNotReady,
                                     "records have not been normalized"});
    }
    buckets_ = build_month_stats(*records_);
    summaries_.reset();
    spdlog::info("Aggregated {} tag-month buckets", buckets_->size());
    return {};
}

std::expected<void, Error> Pipeline::summarize() {
    if (!buckets_) {
        return std::unexpected(Error{ErrorKind::DataNotReady,
                                     "monthly tag statistics have not been built"});
    }
    summaries_ = summarize_tags(*buckets_);
    spdlog::info("Summarized {} tags", summaries_->size());
    return {};
}

std::expected<Snapshot, Error> Pipeline::snapshot() const {
    if (!buckets_ || !summaries_) {
        return std::unexpected(Error{ErrorKind::DataNotReady,
                                     "tag summaries have not been built"});
    }
    return make_snapshot(*buckets_, *summaries_);
}

Snapshot rebuild(const std::vector<RawGameRecord>& raw, int64_t success_threshold) {
    auto records = normalize_records(raw, success_threshold);
    auto buckets = build_month_stats(records);
    auto summaries = summarize_tags(buckets);
    spdlog::info("Rebuilt snapshot: {} records, {} buckets, {} tags",
                 records.size(), buckets.size(), summaries.size());
    return make_snapshot(std::move(buckets), std::move(summaries));
}

Snapshot make_snapshot(std::vector<MonthlyTagBucket> buckets,
                       std::vector<TagSummary> summaries) {
    Snapshot snap;
    if (auto latest = max_month(buckets)) snap.data_last_month = latest->to_string();
    snap.buckets = std::move(buckets);
    snap.summaries = std::move(summaries);
    return snap;
}

void SnapshotStore::publish(std::shared_ptr<const Snapshot> snapshot) {
    std::lock_guard lock(mutex_);
    current_ = std::move(snapshot);
}

std::expected<std::shared_ptr<const Snapshot>, Error> SnapshotStore::current() const {
    std::lock_guard lock(mutex_);
    if (!current_) {
        return std::unexpected(Error{ErrorKind::DataNotReady,
                                     "no tag data has been loaded; run a rebuild first"});
    }
    return current_;
}

} // namespace tagscout
