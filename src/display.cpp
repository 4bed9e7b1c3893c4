#include "tagscout/display.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace tagscout {

namespace {

using namespace ftxui;

// -- Formatting helpers --

std::string f3(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << v;
    return oss.str();
}

std::string fpct(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (v * 100.0) << "%";
    return oss.str();
}

std::string fsigned(double v) {
    return (v > 0 ? "+" : "") + f3(v);
}

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

Color rate_color(double rate) {
    if (rate >= 0.3) return Color::Green;
    if (rate >= 0.15) return Color::Yellow;
    return Color::Red;
}

Color signed_color(double v) {
    if (v > 0) return Color::Green;
    if (v < 0) return Color::Red;
    return Color::GrayDark;
}

Element make_bar_chart(const std::vector<std::pair<std::string, double>>& bars,
                       Color bar_color = Color::Cyan) {
    if (bars.empty()) return text("No data") | dim;

    double max_val = 0.0;
    for (auto& [_, v] : bars) max_val = std::max(max_val, v);
    if (max_val <= 0) max_val = 1.0;

    Elements rows;
    for (auto& [label, val] : bars) {
        rows.push_back(hbox({
            text(label) | size(WIDTH, EQUAL, 9),
            gauge(static_cast<float>(val / max_val)) | size(WIDTH, EQUAL, 30) | color(bar_color),
            text(" " + std::to_string(static_cast<int>(val))) | dim,
        }));
    }
    return vbox(rows);
}

void print_element(Element document) {
    auto screen = Screen::Create(Dimension::Fit(document));
    Render(screen, document);
    std::cout << screen.ToString() << '\n';
}

// -- Render functions --

Element render_recommendations(const RecommendationResult& result) {
    if (result.recommendations.empty()) {
        return text("No tags match the given filters.") | dim;
    }

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"#", "Tag", "Score", "Success 24m", "Trend", "Released 6m",
                    "Complexity", "Penalty"});
    for (size_t i = 0; i < result.recommendations.size(); ++i) {
        auto& r = result.recommendations[i];
        rows.push_back({
            std::to_string(i + 1), r.tag, f3(r.score),
            r.recent_success_rate_24m ? fpct(*r.recent_success_rate_24m) : "n/a",
            fsigned(r.trend_score), std::to_string(r.released_last_6m),
            std::to_string(r.complexity), f3(r.complexity_penalty),
        });
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);

    for (size_t i = 1; i < rows.size(); ++i) {
        auto& r = result.recommendations[i - 1];
        table.SelectCell(2, i).Decorate(color(signed_color(r.score)));
        if (r.recent_success_rate_24m) {
            table.SelectCell(3, i).Decorate(color(rate_color(*r.recent_success_rate_24m)));
        }
        table.SelectCell(4, i).Decorate(color(signed_color(r.trend_score)));
    }

    Elements reasons;
    for (auto& r : result.recommendations) {
        std::string joined;
        for (auto& reason : r.reasons) {
            if (!joined.empty()) joined += "; ";
            joined += reason;
        }
        reasons.push_back(hbox({
            text("  " + r.tag + ": ") | bold,
            text(joined) | dim,
        }));
    }

    return vbox({
        hbox({
            text("Tag Recommendations") | bold | color(Color::Cyan),
            text("  data through " + result.data_last_month) | dim,
            text("  " + std::to_string(result.unique_tags) + " eligible tags") | dim,
        }),
        separator(),
        table.Render(),
        text(""),
        text("  Reasons") | bold,
        vbox(reasons),
    });
}

Element render_timeseries(const std::string& tag, const std::vector<TimeseriesPoint>& points) {
    if (points.empty()) return text("No data for tag '" + tag + "'.") | dim;

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Month", "Released", "Success Rate"});
    std::vector<std::pair<std::string, double>> bars;
    for (auto& p : points) {
        rows.push_back({p.month.to_string(), std::to_string(p.released_count),
                        fpct(p.success_rate)});
        bars.emplace_back(p.month.to_string(), p.released_count);
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectAll().Border(LIGHT);
    for (size_t i = 1; i < rows.size(); ++i) {
        table.SelectCell(2, i).Decorate(color(rate_color(points[i - 1].success_rate)));
    }

    return vbox({
        text("Monthly Releases: " + tag) | bold | color(Color::Cyan),
        separator(),
        table.Render(),
        text(""),
        text("  Released per Month") | bold,
        make_bar_chart(bars),
    });
}

} // namespace

std::string recommendations_csv(const RecommendationResult& result) {
    std::ostringstream out;
    out << "rank,tag,score,recent_success_rate_24m,trend_score,released_last_6m,"
           "complexity,complexity_penalty,reasons\n";
    for (size_t i = 0; i < result.recommendations.size(); ++i) {
        auto& r = result.recommendations[i];
        std::string reasons;
        for (auto& reason : r.reasons) {
            if (!reasons.empty()) reasons += "; ";
            reasons += reason;
        }
        out << (i + 1) << ',' << csv_field(r.tag) << ',' << f3(r.score) << ','
            << (r.recent_success_rate_24m ? f3(*r.recent_success_rate_24m) : "") << ','
            << f3(r.trend_score) << ',' << r.released_last_6m << ','
            << r.complexity << ',' << f3(r.complexity_penalty) << ','
            << csv_field(reasons) << '\n';
    }
    return out.str();
}

std::string timeseries_csv(const std::vector<TimeseriesPoint>& points) {
    std::ostringstream out;
    out << "year_month,released_count,success_rate\n";
    for (auto& p : points) {
        out << p.month.to_string() << ',' << p.released_count << ',' << f3(p.success_rate) << '\n';
    }
    return out.str();
}

void display_recommendations(const RecommendationResult& result, OutputFormat format) {
    if (format == OutputFormat::Csv) {
        std::cout << recommendations_csv(result);
        return;
    }
    print_element(render_recommendations(result));
}

void display_timeseries(const std::string& tag, const std::vector<TimeseriesPoint>& points,
                        OutputFormat format) {
    if (format == OutputFormat::Csv) {
        std::cout << timeseries_csv(points);
        return;
    }
    print_element(render_timeseries(tag, points));
}

void display_tags(const std::vector<std::string>& tags, OutputFormat format) {
    if (format == OutputFormat::Csv) {
        std::cout << "tag\n";
        for (auto& t : tags) std::cout << csv_field(t) << '\n';
        return;
    }

    Elements items;
    for (auto& t : tags) items.push_back(text(t));
    print_element(vbox({
        text("Known Tags (" + std::to_string(tags.size()) + ")") | bold | color(Color::Cyan),
        separator(),
        vbox(items),
    }));
}

} // namespace tagscout
