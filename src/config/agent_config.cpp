#include <docdrop/config/agent_config.h>
#include <docdrop/config/config_helpers.h>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <limits>
#include <string_view>

namespace docdrop::config {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels{"trace", "debug", "info",    "warn",
                                                     "error", "critical", "off"};

Error missing(std::string_view what, std::string_view flag, std::string_view env,
              std::string_view hint = {}) {
    std::string msg = fmt::format("{} is required.", what);
    if (!hint.empty()) {
        msg += fmt::format(" {}", hint);
    }
    msg += fmt::format(" Use --{} flag or {} environment variable", flag, env);
    return Error{ErrorCode::ConfigError, std::move(msg)};
}

Error invalid(std::string_view what, std::string_view value, std::string_view flag,
              std::string_view env) {
    return Error{ErrorCode::ConfigError, fmt::format("Invalid {} '{}' (--{} / {})", what, value,
                                                     flag, env)};
}

} // namespace

void registerAgentOptions(CLI::App& app, CliOptions& opts) {
    app.add_option("--api-id", opts.apiId, "API ID from https://my.telegram.org")
        ->envname("TELEGRAM_API_ID");
    app.add_option("--api-hash", opts.apiHash, "API hash from https://my.telegram.org")
        ->envname("TELEGRAM_API_HASH");
    app.add_option("--phone", opts.phone, "Account phone number with country code (+1234567890)")
        ->envname("TELEGRAM_PHONE");
    app.add_option("--folder", opts.folder, "Download folder path")->envname("TELEGRAM_FOLDER");
    app.add_option("--user", opts.userId,
                   "Allowed user ID (the only sender that may trigger downloads)")
        ->envname("TELEGRAM_USER_ID");
    app.add_option("--channel", opts.channelId,
                   "Channel/group ID to monitor instead of private messages (optional)")
        ->envname("TELEGRAM_CHANNEL_ID");
    app.add_option("--types", opts.types,
                   "Comma-separated allowed file extensions, e.g. pdf,txt,docx (empty = all)")
        ->envname("TELEGRAM_ALLOWED_TYPES");
    app.add_option("--max-size", opts.maxSize, "Maximum accepted document size in bytes")
        ->envname("TELEGRAM_MAX_FILE_SIZE");
    app.add_flag("--debug{true}", opts.debug, "Debug mode (--debug or --debug=false)")
        ->envname("TELEGRAM_DEBUG");
    app.add_option("--session", opts.session, "Session directory used to persist the login")
        ->envname("TELEGRAM_SESSION");
    app.add_option("--code-file", opts.codeFile,
                   "File to read the verification code from (waits for creation)")
        ->envname("TELEGRAM_CODE_FILE");
    app.add_option("--password-file", opts.passwordFile,
                   "File to read the 2FA password from (waits for creation)")
        ->envname("TELEGRAM_PASSWORD_FILE");
    app.add_option("--log-file", opts.logFile, "Also write logs to this rotating file")
        ->envname("TELEGRAM_LOG_FILE");
    app.add_option("--log-level", opts.logLevel, "Log level (trace/debug/info/warn/error)")
        ->envname("TELEGRAM_LOG_LEVEL");
}

Result<AgentConfig> resolveAgentConfig(const CliOptions& opts) {
    AgentConfig cfg;

    // Required values, checked in the order an operator would configure them
    const auto apiIdRaw = trimmed(opts.apiId);
    if (apiIdRaw.empty()) {
        return missing("API ID", "api-id", "TELEGRAM_API_ID",
                       "Get it from https://my.telegram.org and");
    }
    auto apiId = parse_int64(apiIdRaw);
    if (!apiId || *apiId <= 0 || *apiId > std::numeric_limits<std::int32_t>::max()) {
        return invalid("API ID", apiIdRaw, "api-id", "TELEGRAM_API_ID");
    }
    cfg.apiId = static_cast<std::int32_t>(*apiId);

    cfg.apiHash = trimmed(opts.apiHash);
    if (cfg.apiHash.empty()) {
        return missing("API hash", "api-hash", "TELEGRAM_API_HASH",
                       "Get it from https://my.telegram.org and");
    }

    cfg.phone = trimmed(opts.phone);
    if (cfg.phone.empty()) {
        return missing("Phone number", "phone", "TELEGRAM_PHONE");
    }

    const auto folder = trimmed(opts.folder);
    if (folder.empty()) {
        return missing("Download folder path", "folder", "TELEGRAM_FOLDER");
    }
    cfg.downloadRoot = folder;

    const auto userRaw = trimmed(opts.userId);
    if (userRaw.empty()) {
        return missing("Allowed user ID", "user", "TELEGRAM_USER_ID");
    }
    auto userId = parse_int64(userRaw);
    if (!userId) {
        return invalid("user ID", userRaw, "user", "TELEGRAM_USER_ID");
    }
    cfg.allowedUserId = *userId;

    // Optional values
    if (const auto channelRaw = trimmed(opts.channelId); !channelRaw.empty()) {
        auto channelId = parse_int64(channelRaw);
        if (!channelId) {
            return invalid("channel ID", channelRaw, "channel", "TELEGRAM_CHANNEL_ID");
        }
        // 0 keeps direct-message mode
        if (*channelId != 0) {
            cfg.containerId = *channelId;
        }
    }

    cfg.allowedExtensions = parse_extension_list(opts.types);

    if (const auto maxRaw = trimmed(opts.maxSize); !maxRaw.empty()) {
        auto maxBytes = parse_uint64(maxRaw);
        if (!maxBytes || *maxBytes == 0) {
            return invalid("maximum file size", maxRaw, "max-size", "TELEGRAM_MAX_FILE_SIZE");
        }
        cfg.maxFileBytes = *maxBytes;
    }

    // An unparsable debug value means "off"
    if (!trimmed(opts.debug).empty()) {
        cfg.debug = parse_bool(opts.debug).value_or(false);
    }

    if (const auto level = to_lower(trimmed(opts.logLevel)); !level.empty()) {
        if (std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
            return invalid("log level", level, "log-level", "TELEGRAM_LOG_LEVEL");
        }
        cfg.logLevel = level;
    } else {
        cfg.logLevel = cfg.debug ? "debug" : "info";
    }

    if (const auto logFile = trimmed(opts.logFile); !logFile.empty()) {
        cfg.logFile = std::filesystem::path(logFile);
    }

    const auto session = trimmed(opts.session);
    const auto codeFile = trimmed(opts.codeFile);
    const auto passwordFile = trimmed(opts.passwordFile);
    if (session.empty()) {
        return missing("Session path", "session", "TELEGRAM_SESSION");
    }
    if (codeFile.empty()) {
        return missing("Code file path", "code-file", "TELEGRAM_CODE_FILE");
    }
    if (passwordFile.empty()) {
        return missing("Password file path", "password-file", "TELEGRAM_PASSWORD_FILE");
    }
    cfg.sessionPath = session;
    cfg.codeFile = codeFile;
    cfg.passwordFile = passwordFile;

    return cfg;
}

} // namespace docdrop::config
