#include "tagscout/config.hpp"
#include "tagscout/text.hpp"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tagscout {

namespace {

struct EnvEntry {
    std::string key;
    std::string value;
};

// Quoted values are taken verbatim; unquoted ones end at " #".
std::string env_value(std::string_view raw) {
    auto text = trim(raw);
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
        text.back() == text.front()) {
        return text.substr(1, text.size() - 2);
    }
    if (auto hash = text.find(" #"); hash != std::string::npos) {
        return trim(std::string_view(text).substr(0, hash));
    }
    return text;
}

// Accepts KEY=VALUE with an optional leading "export".
std::optional<EnvEntry> parse_env_line(std::string_view line) {
    auto text = trim(line);
    std::string_view body = text;
    if (body.starts_with("export ")) body.remove_prefix(7);

    auto eq = body.find('=');
    if (eq == std::string_view::npos) return std::nullopt;

    auto key = trim(body.substr(0, eq));
    if (key.empty() || key.find_first_of(" \t") != std::string::npos) return std::nullopt;
    return EnvEntry{.key = std::move(key), .value = env_value(body.substr(eq + 1))};
}

template <typename T>
void read_number(const std::string& key, T& target) {
    auto raw = get_env(key);
    if (!raw) return;

    auto text = trim(*raw);
    bool ok = false;
    T value{};
    if constexpr (std::is_floating_point_v<T>) {
        char* end = nullptr;
        value = static_cast<T>(std::strtod(text.c_str(), &end));
        ok = !text.empty() && *end == '\0' && std::isfinite(value);
    } else {
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        ok = !text.empty() && ec == std::errc{} && ptr == text.data() + text.size();
    }

    if (!ok) {
        spdlog::warn("Ignoring {}='{}': not a number in range", key, *raw);
        return;
    }
    target = value;
}

} // namespace

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path) {

    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("No env file at {}", path.string());
        return vars;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        auto text = trim(line);
        if (text.empty() || text.front() == '#') continue;

        auto entry = parse_env_line(text);
        if (!entry) {
            spdlog::debug("{}:{}: ignoring malformed line", path.string(), line_no);
            continue;
        }

        ::setenv(entry->key.c_str(), entry->value.c_str(), 0); // existing values win
        vars[entry->key] = std::move(entry->value);
    }

    spdlog::debug("Read {} variables from {}", vars.size(), path.string());
    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    if (!val) return std::nullopt;
    return std::string(val);
}

Settings load_settings() {
    Settings s;

    if (auto v = get_env("TAGSCOUT_DATA_DIR")) s.data_dir = *v;
    s.raw_csv = s.data_dir / "raw" / "steam_games.csv";
    s.processed_dir = s.data_dir / "processed";
    s.tag_complexity_json = s.data_dir / "config" / "tag_complexity.json";

    if (auto v = get_env("TAGSCOUT_RAW_CSV")) s.raw_csv = *v;
    if (auto v = get_env("TAGSCOUT_PROCESSED_DIR")) s.processed_dir = *v;
    if (auto v = get_env("TAGSCOUT_TAG_COMPLEXITY")) s.tag_complexity_json = *v;

    read_number("TAGSCOUT_W_SUCCESS", s.scoring.w_success);
    read_number("TAGSCOUT_W_TREND", s.scoring.w_trend);
    read_number("TAGSCOUT_W_SATURATION", s.scoring.w_saturation);
    read_number("TAGSCOUT_PREFER_BONUS", s.scoring.prefer_bonus);
    read_number("TAGSCOUT_DEFAULT_COMPLEXITY", s.scoring.default_complexity);
    read_number("TAGSCOUT_SUCCESS_THRESHOLD", s.success_threshold);

    if (auto v = get_env("TAGSCOUT_HOST")) s.host = *v;
    read_number("TAGSCOUT_PORT", s.port);
    if (auto v = get_env("TAGSCOUT_LOG_LEVEL")) s.log_level = to_lower(trim(*v));

    return s;
}

void apply_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', keeping {}", level,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return;
    }
    spdlog::set_level(parsed);
}

std::expected<ComplexityMap, Error> load_tag_complexity(
    const std::filesystem::path& path) {

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(Error{ErrorKind::Io,
                                     "tag complexity config not found at " + path.string()});
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(Error{ErrorKind::Io,
                                     "invalid tag complexity JSON: " + std::string(e.what())});
    }

    if (!doc.is_object()) {
        return std::unexpected(Error{ErrorKind::Io,
                                     "tag complexity config must be a JSON object"});
    }

    ComplexityMap map;
    for (auto& [tag, value] : doc.items()) {
        if (!value.is_number_integer()) {
            spdlog::warn("Skipping complexity for '{}': not an integer", tag);
            continue;
        }
        int c = value.get<int>();
        if (c < 1 || c > 5) {
            spdlog::warn("Skipping complexity for '{}': {} is outside 1..5", tag, c);
            continue;
        }
        map[tag] = c;
    }

    spdlog::debug("Loaded {} tag complexity entries from {}", map.size(), path.string());
    return map;
}

} // namespace tagscout
