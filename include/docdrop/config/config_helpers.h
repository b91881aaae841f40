#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docdrop::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string trimmed(std::string_view s) {
    std::string out(s);
    trim(out);
    return out;
}

inline std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

// Accepts 1/t/true/yes/on and 0/f/false/no/off in any case; anything else is nullopt.
std::optional<bool> parse_bool(std::string_view raw);

// Strict base-10 signed integer parse; rejects trailing garbage and overflow.
std::optional<std::int64_t> parse_int64(std::string_view raw);

// Strict base-10 unsigned integer parse.
std::optional<std::uint64_t> parse_uint64(std::string_view raw);

// Normalize a comma-separated extension list: trimmed, lower-cased, leading dot stripped,
// empty entries dropped, duplicates removed (first occurrence wins).
std::vector<std::string> parse_extension_list(std::string_view raw);

// Join with ", " for human-readable messages.
std::string join(const std::vector<std::string>& items, std::string_view separator = ", ");

} // namespace docdrop::config
