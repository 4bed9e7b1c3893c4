#include "tagscout/text.hpp"
#include <algorithm>
#include <cctype>

namespace tagscout {

namespace {

constexpr std::string_view whitespace = " \t\r\n\f\v";

} // namespace

std::string trim(std::string_view sv) {
    sv.remove_prefix(std::min(sv.find_first_not_of(whitespace), sv.size()));
    sv.remove_suffix(sv.size() - std::min(sv.find_last_not_of(whitespace) + 1, sv.size()));
    return std::string(sv);
}

std::string to_lower(std::string s) {
    std::ranges::transform(s, s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string tag_key(std::string_view tag) {
    return to_lower(trim(tag));
}

} // namespace tagscout
