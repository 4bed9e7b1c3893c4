#include "tagscout/csv_reader.hpp"
#include "tagscout/text.hpp"
#include <fstream>
#include <initializer_list>
#include <string_view>
#include <spdlog/spdlog.h>

namespace tagscout {

namespace {

std::optional<size_t> find_column(const CsvRow& header,
                                  std::initializer_list<std::string_view> names) {
    for (auto name : names) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] && tag_key(*header[i]) == name) return i;
        }
    }
    return std::nullopt;
}

std::optional<std::string> cell(const CsvRow& row, std::optional<size_t> col) {
    if (!col || *col >= row.size()) return std::nullopt;
    return row[*col];
}

} // namespace

std::vector<CsvRow> parse_csv(std::istream& in) {
    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool quoted = false;      // inside quotes
    bool was_quoted = false;  // current field started with a quote
    bool row_has_data = false;

    auto end_field = [&] {
        if (field.empty() && !was_quoted) row.emplace_back(std::nullopt);
        else row.emplace_back(std::move(field));
        field.clear();
        was_quoted = false;
    };

    auto end_row = [&] {
        end_field();
        // Skip blank lines
        if (row_has_data || row.size() > 1 || row.front()) rows.push_back(std::move(row));
        row.clear();
        row_has_data = false;
    };

    char c;
    while (in.get(c)) {
        if (quoted) {
            if (c == '"') {
                if (in.peek() == '"') {
                    in.get(c);
                    field.push_back('"');
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
        case '"':
            quoted = true;
            was_quoted = true;
            row_has_data = true;
            break;
        case ',':
            end_field();
            row_has_data = true;
            break;
        case '\r':
            if (in.peek() == '\n') in.get(c);
            end_row();
            break;
        case '\n':
            end_row();
            break;
        default:
            field.push_back(c);
            row_has_data = true;
            break;
        }
    }

    if (row_has_data || !field.empty() || !row.empty()) end_row();
    return rows;
}

std::expected<std::vector<RawGameRecord>, Error> read_games_csv(std::istream& in) {
    auto rows = parse_csv(in);
    if (rows.empty()) {
        return std::unexpected(Error{ErrorKind::Io, "CSV has no header row"});
    }

    auto& header = rows.front();
    if (!header.empty() && header[0] && header[0]->starts_with("\xEF\xBB\xBF")) {
        header[0]->erase(0, 3);
    }
    auto id_col = find_column(header, {"steam_appid", "appid", "id"});
    auto name_col = find_column(header, {"name"});
    auto tags_col = find_column(header, {"tags"});
    auto date_col = find_column(header, {"release_date"});
    auto reviews_col = find_column(header, {"total_reviews"});

    if (!tags_col) {
        return std::unexpected(Error{ErrorKind::Io, "CSV is missing required column 'tags'"});
    }
    if (!date_col) spdlog::warn("CSV has no release_date column; no record will be dated");
    if (!reviews_col) spdlog::warn("CSV has no total_reviews column; every record is unsuccessful");

    std::vector<RawGameRecord> records;
    records.reserve(rows.size() - 1);
    for (size_t i = 1; i < rows.size(); ++i) {
        auto& row = rows[i];
        records.push_back({
            .id = cell(row, id_col).value_or(std::to_string(i)),
            .name = cell(row, name_col).value_or(""),
            .tags = cell(row, tags_col),
            .release_date = cell(row, date_col),
            .total_reviews = cell(row, reviews_col),
        });
    }

    return records;
}

std::expected<std::vector<RawGameRecord>, Error> read_games_csv(
    const std::filesystem::path& path) {

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(Error{ErrorKind::Io, "input CSV not found at " + path.string()});
    }

    auto records = read_games_csv(file);
    if (records) spdlog::info("Loaded {} rows from {}", records->size(), path.string());
    return records;
}

} // namespace tagscout
