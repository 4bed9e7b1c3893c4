#include "tagscout/cache.hpp"
#include "tagscout/json_codec.hpp"
#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace tagscout {

namespace {

template <typename T, typename Parse>
std::optional<std::vector<T>> parse_rows(const nlohmann::json& doc, Parse parse) {
    if (!doc.is_array()) return std::nullopt;

    std::vector<T> rows;
    rows.reserve(doc.size());
    for (auto& j : doc) {
        auto row = parse(j);
        if (!row) return std::nullopt;
        rows.push_back(std::move(*row));
    }
    return rows;
}

} // namespace

Cache::Cache(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {}

std::optional<std::vector<MonthlyTagBucket>> Cache::get_month_stats() const {
    auto doc = read_json(base_dir_ / month_stats_file_);
    if (!doc) return std::nullopt;
    auto rows = parse_rows<MonthlyTagBucket>(*doc, parse_bucket);
    if (!rows) spdlog::warn("Discarding malformed {}", month_stats_file_);
    return rows;
}

std::expected<void, Error> Cache::store_month_stats(const std::vector<MonthlyTagBucket>& buckets) {
    return write_json(base_dir_ / month_stats_file_, buckets);
}

std::optional<std::vector<TagSummary>> Cache::get_tag_summary() const {
    auto doc = read_json(base_dir_ / tag_summary_file_);
    if (!doc) return std::nullopt;
    auto rows = parse_rows<TagSummary>(*doc, parse_summary);
    if (!rows) spdlog::warn("Discarding malformed {}", tag_summary_file_);
    return rows;
}

std::expected<void, Error> Cache::store_tag_summary(const std::vector<TagSummary>& summaries) {
    return write_json(base_dir_ / tag_summary_file_, summaries);
}

std::optional<nlohmann::json> Cache::read_json(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) return std::nullopt;

    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Failed to parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::expected<void, Error> Cache::write_json(const std::filesystem::path& path,
                                             const nlohmann::json& data) const {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::Io,
                                     "cannot create " + base_dir_.string() + ": " + ec.message()});
    }

    // Write beside the target and rename so readers never see a partial file.
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            return std::unexpected(Error{ErrorKind::Io, "cannot write " + tmp.string()});
        }
        file << data.dump(2);
        if (!file) {
            return std::unexpected(Error{ErrorKind::Io, "failed writing " + tmp.string()});
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::Io,
                                     "cannot replace " + path.string() + ": " + ec.message()});
    }
    return {};
}

std::expected<Snapshot, Error> load_snapshot(const Cache& cache) {
    auto buckets = cache.get_month_stats();
    auto summaries = cache.get_tag_summary();
    if (!buckets || !summaries) {
        return std::unexpected(Error{ErrorKind::DataNotReady,
                                     "processed tables not found in " + cache.base_dir().string() +
                                     "; run 'tagscout build' first"});
    }
    return make_snapshot(std::move(*buckets), std::move(*summaries));
}

std::expected<void, Error> store_snapshot(Cache& cache, const Snapshot& snapshot) {
    if (auto r = cache.store_month_stats(snapshot.buckets); !r) return r;
    if (auto r = cache.store_tag_summary(snapshot.summaries); !r) return r;
    spdlog::info("Stored {} buckets and {} tag summaries in {}",
                 snapshot.buckets.size(), snapshot.summaries.size(),
                 cache.base_dir().string());
    return {};
}

} // namespace tagscout
