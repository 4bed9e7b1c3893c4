#include "tagscout/analytics.hpp"
#include "tagscout/cache.hpp"
#include "tagscout/config.hpp"
#include "tagscout/csv_reader.hpp"
#include "tagscout/display.hpp"
#include "tagscout/normalizer.hpp"
#include "tagscout/pipeline.hpp"
#include "tagscout/ranker.hpp"
#include "tagscout/server.hpp"
#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

struct CliArgs {
    std::string command;
    std::string tag;
    std::optional<std::string> csv;
    std::optional<std::string> host;
    std::optional<int> port;
    tagscout::RecommendationRequest request;
    tagscout::OutputFormat format = tagscout::OutputFormat::Table;
};

void print_usage() {
    std::cerr << R"(Usage: tagscout <command> [options]
Commands:
  build                     Rebuild processed tables from the raw CSV
  recommend                 Rank tags for a team profile
  timeseries <tag>          Monthly releases and success rate for one tag
  tags                      List known tags
  serve                     Run the HTTP API
Options:
  --csv <path>              Raw CSV (build; default TAGSCOUT_RAW_CSV)
  --team-size <n>           Team size (recommend; default 1)
  --top <n>                 Number of recommendations (default 10)
  --prefer <a,b,...>        Tags that receive a bonus
  --avoid <a,b,...>         Tags to exclude
  --allow <a,b,...>         Only consider these tags
  --format <table|csv>      Output format (default: table)
  --host <addr>             Bind address (serve; default TAGSCOUT_HOST)
  --port <n>                Port (serve; default TAGSCOUT_PORT)
)";
}

std::optional<int> parse_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliArgs args;
    args.command = argv[1];

    int i = 2;
    if (args.command == "timeseries") {
        if (argc < 3) return std::nullopt;
        args.tag = argv[2];
        i = 3;
    }

    for (; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[i + 1];

        if (flag == "--csv") args.csv = val;
        else if (flag == "--host") args.host = val;
        else if (flag == "--prefer") args.request.prefer_tags = tagscout::parse_tags(val);
        else if (flag == "--avoid") args.request.avoid_tags = tagscout::parse_tags(val);
        else if (flag == "--allow") args.request.allow_tags = tagscout::parse_tags(val);
        else if (flag == "--format") {
            args.format = (val == "csv") ? tagscout::OutputFormat::Csv
                                         : tagscout::OutputFormat::Table;
        }
        else if (flag == "--team-size" || flag == "--top" || flag == "--port") {
            auto n = parse_int(val);
            if (!n) {
                std::cerr << "Expected an integer for " << flag << ", got '" << val << "'\n";
                return std::nullopt;
            }
            if (flag == "--team-size") args.request.team_size = *n;
            else if (flag == "--top") args.request.top_n = *n;
            else args.port = *n;
        }
        else {
            std::cerr << "Unknown option: " << flag << "\n";
            return std::nullopt;
        }
    }

    return args;
}

int fail(const tagscout::Error& e) {
    std::cerr << "Error (" << tagscout::to_string(e.kind) << "): " << e.message << "\n";
    return 1;
}

tagscout::ComplexityMap complexity_or_defaults(const tagscout::Settings& settings) {
    auto complexity = tagscout::load_tag_complexity(settings.tag_complexity_json);
    if (!complexity) {
        spdlog::warn("{}; every tag uses complexity {}", complexity.error().message,
                     settings.scoring.default_complexity);
        return {};
    }
    return std::move(*complexity);
}

int run_build(const CliArgs& args, const tagscout::Settings& settings) {
    auto raw = tagscout::read_games_csv(args.csv ? *args.csv : settings.raw_csv.string());
    if (!raw) return fail(raw.error());

    tagscout::Pipeline pipeline(settings.success_threshold);
    pipeline.normalize(*raw);
    if (auto r = pipeline.aggregate(); !r) return fail(r.error());
    if (auto r = pipeline.summarize(); !r) return fail(r.error());

    auto snapshot = pipeline.snapshot();
    if (!snapshot) return fail(snapshot.error());

    tagscout::Cache cache(settings.processed_dir);
    if (auto r = tagscout::store_snapshot(cache, *snapshot); !r) return fail(r.error());

    std::cout << "Built " << snapshot->summaries.size() << " tag summaries from "
              << snapshot->buckets.size() << " tag-month buckets (data through "
              << (snapshot->data_last_month.empty() ? "n/a" : snapshot->data_last_month)
              << ")\n";
    return 0;
}

int run_serve(const CliArgs& args, const tagscout::Settings& settings) {
    tagscout::TagService service(settings, complexity_or_defaults(settings));

    auto cached = tagscout::load_snapshot(tagscout::Cache(settings.processed_dir));
    if (cached) {
        service.store().publish(std::make_shared<const tagscout::Snapshot>(std::move(*cached)));
    } else {
        spdlog::warn("{}; queries fail until POST /rebuild succeeds", cached.error().message);
    }

    bool ok = tagscout::run_server(service, args.host.value_or(settings.host),
                                   args.port.value_or(settings.port));
    return ok ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("tagscout"));

    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    tagscout::load_env();
    auto settings = tagscout::load_settings();
    tagscout::apply_log_level(settings.log_level);

    if (args->command == "build") return run_build(*args, settings);
    if (args->command == "serve") return run_serve(*args, settings);

    if (args->command != "recommend" && args->command != "timeseries" &&
        args->command != "tags") {
        std::cerr << "Unknown command: " << args->command << "\n";
        print_usage();
        return 1;
    }

    auto snapshot = tagscout::load_snapshot(tagscout::Cache(settings.processed_dir));
    if (!snapshot) return fail(snapshot.error());

    if (args->command == "recommend") {
        auto result = tagscout::recommend_tags(
            snapshot->summaries, args->request, complexity_or_defaults(settings),
            settings.scoring);
        if (!result) return fail(result.error());
        tagscout::display_recommendations(*result, args->format);
    } else if (args->command == "timeseries") {
        tagscout::display_timeseries(
            args->tag, tagscout::tag_timeseries(args->tag, snapshot->buckets), args->format);
    } else {
        tagscout::display_tags(tagscout::list_tags(snapshot->summaries), args->format);
    }

    return 0;
}
