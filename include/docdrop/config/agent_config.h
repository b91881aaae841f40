#pragma once

#include <docdrop/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace docdrop::config {

// The platform's client API accepts documents up to 2 GiB.
inline constexpr std::uint64_t kDefaultMaxFileBytes = 2ull * 1024ull * 1024ull * 1024ull;
inline constexpr std::chrono::milliseconds kSecretTimeout{5 * 60 * 1000};
inline constexpr std::chrono::milliseconds kProgressInterval{2000};

/**
 * Fully resolved agent configuration. Built once at start-up and passed by value or const
 * reference to every component; nothing reads the environment after resolution.
 */
struct AgentConfig {
    // Transport credentials
    std::int32_t apiId{0};
    std::string apiHash;
    std::string phone;

    // Routing and authorization
    std::int64_t allowedUserId{0};
    std::optional<std::int64_t> containerId; // presence selects container mode

    // Download policy
    std::filesystem::path downloadRoot;
    std::vector<std::string> allowedExtensions; // lower-case, no leading dot; empty = all
    std::uint64_t maxFileBytes{kDefaultMaxFileBytes};
    std::chrono::milliseconds progressInterval{kProgressInterval};

    // Secret exchange and session persistence
    std::filesystem::path sessionPath{"session"};
    std::filesystem::path codeFile{"telegram_code.txt"};
    std::filesystem::path passwordFile{"telegram_password.txt"};
    std::chrono::milliseconds secretTimeout{kSecretTimeout};

    // Logging
    bool debug{false};
    std::string logLevel{"info"};
    std::optional<std::filesystem::path> logFile;

    bool containerMode() const noexcept { return containerId.has_value(); }
};

/**
 * Raw option values exactly as CLI11 captured them (command line first, then the bound
 * environment variable). Validation happens in resolveAgentConfig().
 */
struct CliOptions {
    std::string apiId;
    std::string apiHash;
    std::string phone;
    std::string folder;
    std::string userId;
    std::string channelId;
    std::string types;
    std::string maxSize;
    std::string debug;
    std::string session{"session"};
    std::string codeFile{"telegram_code.txt"};
    std::string passwordFile{"telegram_password.txt"};
    std::string logFile;
    std::string logLevel;
};

// Bind every recognized flag (and its environment variable) to opts.
void registerAgentOptions(CLI::App& app, CliOptions& opts);

// Validate raw options. Missing or malformed required values yield ErrorCode::ConfigError with a
// message naming the flag and the environment variable.
Result<AgentConfig> resolveAgentConfig(const CliOptions& opts);

} // namespace docdrop::config
