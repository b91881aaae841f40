#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace docdrop::download {

// "<n> B" below 1 KiB, otherwise one decimal in the largest binary unit below 1024
// (KB, MB, GB, TB, PB, EB).
std::string formatBytes(std::uint64_t bytes);

// "<s>s" below a minute, "<m>m <s>s" below an hour, "<h>h <m>m" beyond. Whole units, truncated.
std::string formatDuration(std::chrono::milliseconds duration);

// Twenty-slot bar in brackets: floor(pct * 20 / 100) filled cells. pct is clamped to [0, 100].
std::string renderProgressBar(double percentage);

} // namespace docdrop::download
