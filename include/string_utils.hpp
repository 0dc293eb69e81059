#pragma once

#include <algorithm>
#include <ranges>
#include <string_view>
#include <vector>

bool is_valid_utf8(std::string_view sv);
std::vector<std::string_view> split_lines(std::string_view sv);

// Our own because we don't want any locale interpretations
constexpr char lower(const char c) { return (c >= 'A' && c <= 'Z') ? (c - 'A' + 'a') : c; }

// True if haystack starts with needle, ignoring case. needle must be lowercase.
inline bool icompare(std::string_view haystack, std::string_view needle) {
    if (haystack.length() < needle.length()) {
        return false;
    }

    haystack = haystack.substr(0, needle.length());
    return std::ranges::equal(haystack | std::views::transform(lower), needle);
}
