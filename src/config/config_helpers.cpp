#include <docdrop/config/config_helpers.h>

#include <charconv>
#include <sstream>

namespace docdrop::config {

std::optional<bool> parse_bool(std::string_view raw) {
    const auto v = to_lower(trimmed(raw));
    if (v == "1" || v == "t" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "f" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> parse_int64(std::string_view raw) {
    const auto s = trimmed(raw);
    if (s.empty())
        return std::nullopt;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    // from_chars does not accept a leading '+'
    if (*first == '+')
        ++first;
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    return value;
}

std::optional<std::uint64_t> parse_uint64(std::string_view raw) {
    const auto s = trimmed(raw);
    if (s.empty() || s.front() == '-')
        return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return value;
}

std::vector<std::string> parse_extension_list(std::string_view raw) {
    std::vector<std::string> out;
    std::stringstream ss{std::string(raw)};
    std::string item;
    while (std::getline(ss, item, ',')) {
        trim(item);
        if (item.empty())
            continue;
        if (item.front() == '.')
            item.erase(0, 1);
        item = to_lower(item);
        if (item.empty())
            continue;
        if (std::find(out.begin(), out.end(), item) == out.end())
            out.push_back(item);
    }
    return out;
}

std::string join(const std::vector<std::string>& items, std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0)
            out.append(separator);
        out.append(items[i]);
    }
    return out;
}

} // namespace docdrop::config
