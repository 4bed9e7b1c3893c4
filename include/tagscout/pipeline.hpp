#pragma once

#include "tagscout/normalizer.hpp"
#include "tagscout/types.hpp"
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tagscout {

struct Snapshot {
    std::vector<MonthlyTagBucket> buckets;
    std::vector<TagSummary> summaries;
    std::string data_last_month;
};

// Staged rebuild. Each stage requires the previous one and never triggers
// it implicitly; re-running a stage discards everything downstream of it.
class Pipeline {
public:
    explicit Pipeline(int64_t success_threshold = default_success_threshold);

    void normalize(const std::vector<RawGameRecord>& raw);
    std::expected<void, Error> aggregate();
    std::expected<void, Error> summarize();

    std::expected<Snapshot, Error> snapshot() const;

    const std::optional<std::vector<GameRecord>>& records() const { return records_; }

private:
    int64_t success_threshold_;
    std::optional<std::vector<GameRecord>> records_;
    std::optional<std::vector<MonthlyTagBucket>> buckets_;
    std::optional<std::vector<TagSummary>> summaries_;
};

Snapshot rebuild(const std::vector<RawGameRecord>& raw,
                 int64_t success_threshold = default_success_threshold);

Snapshot make_snapshot(std::vector<MonthlyTagBucket> buckets,
                       std::vector<TagSummary> summaries);

// Holds the snapshot served to readers. publish() replaces the whole
// snapshot; readers keep whichever one they obtained from current().
class SnapshotStore {
public:
    void publish(std::shared_ptr<const Snapshot> snapshot);
    std::expected<std::shared_ptr<const Snapshot>, Error> current() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> current_;
};

} // namespace tagscout
