#include <docdrop/auth/file_authenticator.h>
#include <docdrop/config/agent_config.h>

#include <spdlog/spdlog.h>

namespace docdrop::auth {

FileAuthenticator::FileAuthenticator(const config::AgentConfig& config,
                                     std::shared_ptr<IClock> clock,
                                     std::chrono::milliseconds pollInterval)
    : phone_(config.phone), codeFile_(config.codeFile), passwordFile_(config.passwordFile),
      timeout_(config.secretTimeout), clock_(std::move(clock)), pollInterval_(pollInterval) {}

Result<std::string> FileAuthenticator::acquire(const std::filesystem::path& path,
                                               std::string_view what, std::string_view example,
                                               const ShouldCancel& shouldCancel) {
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(timeout_).count();
    spdlog::info("==========================================");
    spdlog::info("{} REQUIRED", what);
    spdlog::info("Write it to: {}", path.string());
    spdlog::info("Example: echo '{}' > {}", example, path.string());
    spdlog::info("Waiting up to {} minutes...", minutes);
    spdlog::info("==========================================");

    CredentialGate gate(path, timeout_, clock_, pollInterval_);
    auto secret = gate.await(shouldCancel);
    if (!secret) {
        spdlog::error("Failed to obtain {}: {}", what, secret.error().message);
        return secret.error();
    }
    spdlog::info("{} received", what);
    return secret;
}

Result<std::string> FileAuthenticator::code(const ShouldCancel& shouldCancel) {
    return acquire(codeFile_, "VERIFICATION CODE", "12345", shouldCancel);
}

Result<std::string> FileAuthenticator::password(const ShouldCancel& shouldCancel) {
    return acquire(passwordFile_, "2FA PASSWORD", "your_password", shouldCancel);
}

} // namespace docdrop::auth
