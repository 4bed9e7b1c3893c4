#pragma once

#include "tagscout/pipeline.hpp"
#include "tagscout/types.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace tagscout {

// Processed tables stored as JSON files under base_dir.
class Cache {
public:
    explicit Cache(std::filesystem::path base_dir = "data/processed");

    std::optional<std::vector<MonthlyTagBucket>> get_month_stats() const;
    std::expected<void, Error> store_month_stats(const std::vector<MonthlyTagBucket>& buckets);

    std::optional<std::vector<TagSummary>> get_tag_summary() const;
    std::expected<void, Error> store_tag_summary(const std::vector<TagSummary>& summaries);

    const std::filesystem::path& base_dir() const { return base_dir_; }

private:
    std::filesystem::path base_dir_;

    static constexpr const char* month_stats_file_ = "tag_month_stats.json";
    static constexpr const char* tag_summary_file_ = "tag_summary.json";

    std::optional<nlohmann::json> read_json(const std::filesystem::path& path) const;
    std::expected<void, Error> write_json(const std::filesystem::path& path,
                                          const nlohmann::json& data) const;
};

// DataNotReady when either table is missing or unreadable.
std::expected<Snapshot, Error> load_snapshot(const Cache& cache);

std::expected<void, Error> store_snapshot(Cache& cache, const Snapshot& snapshot);

} // namespace tagscout
