#include "tagscout/server.hpp"
#include "tagscout/analytics.hpp"
#include "tagscout/csv_reader.hpp"
#include "tagscout/json_codec.hpp"
#include <chrono>
#include <ctime>
#include <memory>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace tagscout {

namespace {

ServiceResponse error_response(const Error& e) {
    return {
        .status = http_status(e.kind),
        .body = {{"detail", e.message}, {"error", to_string(e.kind)}},
    };
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void reply(httplib::Response& res, const ServiceResponse& r) {
    res.status = r.status;
    res.set_content(r.body.dump(), "application/json");
}

} // namespace

int http_status(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidRequest: return 422;
    case ErrorKind::DataNotReady: return 503;
    case ErrorKind::Io: return 500;
    }
    return 500;
}

TagService::TagService(Settings settings, ComplexityMap complexity)
    : settings_(std::move(settings)),
      complexity_(std::move(complexity)),
      cache_(settings_.processed_dir) {}

ServiceResponse TagService::health() const {
    return {.status = 200, .body = {{"ok", true}}};
}

ServiceResponse TagService::recommend(const std::string& body) const {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return error_response({ErrorKind::InvalidRequest,
                               "request body is not valid JSON: " + std::string(e.what())});
    }

    auto request = parse_request(doc);
    if (!request) return error_response(request.error());

    auto snapshot = store_.current();
    if (!snapshot) return error_response(snapshot.error());

    auto result = recommend_tags((*snapshot)->summaries, *request, complexity_,
                                 settings_.scoring);
    if (!result) return error_response(result.error());

    return {
        .status = 200,
        .body = {
            {"generated_at", utc_timestamp()},
            {"inputs", *request},
            {"recommendations", result->recommendations},
            {"meta", {
                {"data_last_month", result->data_last_month},
                {"unique_tags", result->unique_tags},
            }},
        },
    };
}

ServiceResponse TagService::timeseries(const std::string& tag) const {
    auto snapshot = store_.current();
    if (!snapshot) return error_response(snapshot.error());

    auto points = tag_timeseries(tag, (*snapshot)->buckets);
    if (points.empty()) {
        return {.status = 404, .body = {{"detail", "Tag '" + tag + "' not found in data"}}};
    }
    return {.status = 200, .body = {{"tag", tag}, {"points", points}}};
}

ServiceResponse TagService::tags() const {
    auto snapshot = store_.current();
    if (!snapshot) return error_response(snapshot.error());
    return {.status = 200, .body = {{"tags", list_tags((*snapshot)->summaries)}}};
}

ServiceResponse TagService::rebuild() {
    std::lock_guard lock(rebuild_mutex_);

    auto raw = read_games_csv(settings_.raw_csv);
    if (!raw) return error_response(raw.error());

    auto snapshot = std::make_shared<const Snapshot>(
        tagscout::rebuild(*raw, settings_.success_threshold));

    if (auto stored = store_snapshot(cache_, *snapshot); !stored) {
        spdlog::warn("Rebuilt tables were not persisted: {}", stored.error().message);
    }

    store_.publish(snapshot);
    return {
        .status = 200,
        .body = {
            {"ok", true},
            {"data_last_month", snapshot->data_last_month},
            {"buckets", snapshot->buckets.size()},
            {"unique_tags", snapshot->summaries.size()},
        },
    };
}

bool run_server(TagService& service, const std::string& host, int port) {
    httplib::Server svr;

    svr.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
        reply(res, service.health());
    });

    svr.Post("/recommend", [&](const httplib::Request& req, httplib::Response& res) {
        reply(res, service.recommend(req.body));
    });

    svr.Get(R"(/tag/([^/]+)/timeseries)", [&](const httplib::Request& req, httplib::Response& res) {
        reply(res, service.timeseries(req.matches[1].str()));
    });

    svr.Get("/tags", [&](const httplib::Request&, httplib::Response& res) {
        reply(res, service.tags());
    });

    svr.Post("/rebuild", [&](const httplib::Request&, httplib::Response& res) {
        reply(res, service.rebuild());
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        if (res.status >= 400) {
            spdlog::warn("{} {} -> {}", req.method, req.path, res.status);
        } else {
            spdlog::info("{} {} -> {}", req.method, req.path, res.status);
        }
    });

    spdlog::info("Listening on {}:{}", host, port);
    if (!svr.listen(host, port)) {
        spdlog::error("Could not bind {}:{}", host, port);
        return false;
    }
    return true;
}

} // namespace tagscout
