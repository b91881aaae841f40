#include <docdrop/app/logging.h>
#include <docdrop/config/agent_config.h>
#include <docdrop/config/config_helpers.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>
#include <vector>

namespace docdrop::app {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
    const auto level = config::to_lower(config::trimmed(name));
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return std::nullopt;
}

Result<void> configureLogging(const config::AgentConfig& config) {
    const auto level = parseLogLevel(config.logLevel);
    if (!level) {
        return Error{ErrorCode::ConfigError, "unknown log level: " + config.logLevel};
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        if (config.logFile) {
            const auto parent = config.logFile->parent_path();
            if (!parent.empty()) {
                std::error_code ec;
                std::filesystem::create_directories(parent, ec);
                if (ec) {
                    return Error{ErrorCode::IoError, "cannot create log directory " +
                                                         parent.string() + ": " + ec.message()};
                }
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logFile->string(), kLogFileMaxBytes, kLogFileCount));
        }

        auto logger = std::make_shared<spdlog::logger>("docdrop", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_level(*level);
        spdlog::flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        return Error{ErrorCode::IoError, std::string("logger setup failed: ") + e.what()};
    }

    if (config.logFile) {
        spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", config.logFile->string(),
                     kLogFileMaxBytes / (1024 * 1024), kLogFileCount);
    }
    return {};
}

} // namespace docdrop::app
