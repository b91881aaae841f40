#include <docdrop/download/format.h>

#include <fmt/format.h>

#include <algorithm>

namespace docdrop::download {

namespace {
constexpr int kBarSlots = 20;
constexpr std::string_view kFilled = "█";
constexpr std::string_view kEmpty = "░";
} // namespace

std::string formatBytes(std::uint64_t bytes) {
    constexpr std::uint64_t unit = 1024;
    if (bytes < unit) {
        return fmt::format("{} B", bytes);
    }
    std::uint64_t div = unit;
    int exp = 0;
    for (std::uint64_t n = bytes / unit; n >= unit; n /= unit) {
        div *= unit;
        ++exp;
    }
    constexpr const char* units = "KMGTPE";
    return fmt::format("{:.1f} {}B", static_cast<double>(bytes) / static_cast<double>(div),
                       units[exp]);
}

std::string formatDuration(std::chrono::milliseconds duration) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    const auto totalSeconds = std::max<std::int64_t>(0, seconds);
    if (totalSeconds < 60) {
        return fmt::format("{}s", totalSeconds);
    }
    if (totalSeconds < 3600) {
        return fmt::format("{}m {}s", totalSeconds / 60, totalSeconds % 60);
    }
    return fmt::format("{}h {}m", totalSeconds / 3600, (totalSeconds / 60) % 60);
}

std::string renderProgressBar(double percentage) {
    const double pct = std::clamp(percentage, 0.0, 100.0);
    const int filled = std::clamp(static_cast<int>(pct * kBarSlots / 100.0), 0, kBarSlots);

    std::string bar = "[";
    bar.reserve(2 + kBarSlots * kFilled.size());
    for (int i = 0; i < filled; ++i)
        bar.append(kFilled);
    for (int i = filled; i < kBarSlots; ++i)
        bar.append(kEmpty);
    bar += "]";
    return bar;
}

} // namespace docdrop::download
