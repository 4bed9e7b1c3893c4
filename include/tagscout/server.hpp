#pragma once

#include "tagscout/cache.hpp"
#include "tagscout/config.hpp"
#include "tagscout/pipeline.hpp"
#include "tagscout/ranker.hpp"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace tagscout {

struct ServiceResponse {
    int status = 200;
    nlohmann::json body;
};

int http_status(ErrorKind kind);

// Request handlers behind the HTTP routes. Queries read whichever snapshot
// is current when they start; rebuild() publishes a new one.
class TagService {
public:
    TagService(Settings settings, ComplexityMap complexity);

    ServiceResponse health() const;
    ServiceResponse recommend(const std::string& body) const;
    ServiceResponse timeseries(const std::string& tag) const;
    ServiceResponse tags() const;
    ServiceResponse rebuild();

    SnapshotStore& store() { return store_; }

private:
    Settings settings_;
    ComplexityMap complexity_;
    Cache cache_;
    SnapshotStore store_;
    std::mutex rebuild_mutex_;
};

// Blocks until the server stops. Returns false if the socket cannot be bound.
bool run_server(TagService& service, const std::string& host, int port);

} // namespace tagscout
