#pragma once

#include "tagscout/types.hpp"
#include <expected>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace tagscout {

using CsvRow = std::vector<std::optional<std::string>>;

// RFC 4180 rows: quoted fields may hold commas, doubled quotes and line
// breaks. Empty unquoted fields are null.
std::vector<CsvRow> parse_csv(std::istream& in);

// Header-driven: steam_appid|appid|id, name, tags, release_date,
// total_reviews. Only "tags" is required.
std::expected<std::vector<RawGameRecord>, Error> read_games_csv(std::istream& in);

std::expected<std::vector<RawGameRecord>, Error> read_games_csv(
    const std::filesystem::path& path);

} // namespace tagscout
