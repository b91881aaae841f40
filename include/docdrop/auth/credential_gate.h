#pragma once

#include <docdrop/core/clock.h>
#include <docdrop/core/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace docdrop::auth {

inline constexpr std::chrono::milliseconds kPollInterval{500};

/**
 * Bounded wait for an operator-supplied secret dropped into a file.
 *
 * await() checks immediately, then every poll interval, until the file holds non-empty trimmed
 * text or the timeout elapses. A successful read deletes the file before the secret is returned;
 * if the delete fails the secret is withheld. An existing but empty file counts as not ready.
 *
 * Errors: Timeout, OperationCancelled, IoError (unreadable file or failed delete).
 */
class CredentialGate {
public:
    CredentialGate(std::filesystem::path path, std::chrono::milliseconds timeout,
                   std::shared_ptr<IClock> clock = systemClock(),
                   std::chrono::milliseconds pollInterval = kPollInterval);

    Result<std::string> await(const ShouldCancel& shouldCancel = {});

    const std::filesystem::path& path() const noexcept { return path_; }
    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    // nullopt = not there yet
    Result<std::optional<std::string>> tryConsume(bool& loggedEmpty);

    std::filesystem::path path_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<IClock> clock_;
    std::chrono::milliseconds pollInterval_;
};

} // namespace docdrop::auth
