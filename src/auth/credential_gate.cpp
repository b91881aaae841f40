#include <docdrop/auth/credential_gate.h>
#include <docdrop/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace docdrop::auth {

namespace fs = std::filesystem;

CredentialGate::CredentialGate(fs::path path, std::chrono::milliseconds timeout,
                               std::shared_ptr<IClock> clock,
                               std::chrono::milliseconds pollInterval)
    : path_(std::move(path)), timeout_(timeout), clock_(clock ? std::move(clock) : systemClock()),
      pollInterval_(pollInterval.count() > 0 ? pollInterval : kPollInterval) {}

Result<std::optional<std::string>> CredentialGate::tryConsume(bool& loggedEmpty) {
    std::error_code ec;
    const auto status = fs::status(path_, ec);
    if (ec || !fs::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return Error{ErrorCode::IoError,
                         "cannot stat " + path_.string() + ": " + ec.message()};
        }
        return std::optional<std::string>{};
    }
    if (!fs::is_regular_file(status)) {
        return Error{ErrorCode::IoError, path_.string() + " is not a regular file"};
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        // Deleted between stat and open
        if (!fs::exists(path_, ec)) {
            return std::optional<std::string>{};
        }
        return Error{ErrorCode::IoError, "cannot read " + path_.string()};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    in.close();

    std::string secret = config::trimmed(buf.str());
    if (secret.empty()) {
        if (!loggedEmpty) {
            spdlog::info("{} exists but is empty, waiting for content", path_.string());
            loggedEmpty = true;
        }
        return std::optional<std::string>{};
    }

    if (!fs::remove(path_, ec) || ec) {
        return Error{ErrorCode::IoError,
                     "read " + path_.string() + " but could not delete it: " +
                         (ec ? ec.message() : std::string("file vanished"))};
    }
    spdlog::info("Read and removed {}", path_.string());
    return std::optional<std::string>{std::move(secret)};
}

Result<std::string> CredentialGate::await(const ShouldCancel& shouldCancel) {
    const auto deadline = clock_->now() + timeout_;
    bool loggedEmpty = false;

    spdlog::info("Waiting for {} (timeout {}s)", path_.string(),
                 std::chrono::duration_cast<std::chrono::seconds>(timeout_).count());

    while (true) {
        if (cancelled(shouldCancel)) {
            return Error{ErrorCode::OperationCancelled,
                         "wait for " + path_.string() + " cancelled"};
        }

        auto probe = tryConsume(loggedEmpty);
        if (!probe) {
            return probe.error();
        }
        if (probe.value()) {
            return std::move(*probe.value());
        }

        const auto now = clock_->now();
        if (now >= deadline) {
            return Error{ErrorCode::Timeout, "timeout waiting for " + path_.string()};
        }
        auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        slice = std::clamp(slice, std::chrono::milliseconds(1), pollInterval_);
        clock_->sleepFor(slice);
    }
}

} // namespace docdrop::auth
