#include "tagscout/types.hpp"
#include <cstdio>

namespace tagscout {

std::string YearMonth::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
    return buf;
}

std::optional<YearMonth> parse_year_month(const std::string& s) {
    int year = 0, month = 0;
    char trailing = 0;
    if (std::sscanf(s.c_str(), "%d-%d%c", &year, &month, &trailing) != 2) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || year < 0) return std::nullopt;
    return YearMonth{.year = year, .month = month};
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::DataNotReady: return "DataNotReady";
    case ErrorKind::InvalidRequest: return "InvalidRequest";
    case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

} // namespace tagscout
