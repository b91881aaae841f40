#pragma once

#include <docdrop/core/types.h>

#include <spdlog/common.h>

#include <optional>
#include <string_view>

namespace docdrop::config {
struct AgentConfig;
}

namespace docdrop::app {

inline constexpr std::size_t kLogFileMaxBytes = 10 * 1024 * 1024;
inline constexpr std::size_t kLogFileCount = 5;

// trace/debug/info/warn/error/critical/off, case-insensitive.
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name);

// Console logger, plus a rotating file sink when a log file is configured.
Result<void> configureLogging(const config::AgentConfig& config);

} // namespace docdrop::app
