#pragma once

#include <string>
#include <string_view>

namespace tagscout {

std::string trim(std::string_view sv);

std::string to_lower(std::string s);

// Trimmed, lowercased form used for case-insensitive tag matching.
std::string tag_key(std::string_view tag);

} // namespace tagscout
