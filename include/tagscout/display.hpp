#pragma once

#include "tagscout/types.hpp"
#include <string>
#include <vector>

namespace tagscout {

enum class OutputFormat {
    Table,
    Csv,
};

std::string recommendations_csv(const RecommendationResult& result);
std::string timeseries_csv(const std::vector<TimeseriesPoint>& points);

void display_recommendations(const RecommendationResult& result, OutputFormat format);
void display_timeseries(const std::string& tag, const std::vector<TimeseriesPoint>& points,
                        OutputFormat format);
void display_tags(const std::vector<std::string>& tags, OutputFormat format);

} // namespace tagscout
