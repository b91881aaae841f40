#pragma once

#include <docdrop/auth/credential_gate.h>
#include <docdrop/messenger/messenger.h>

#include <memory>
#include <string>

namespace docdrop::config {
struct AgentConfig;
}

namespace docdrop::auth {

/**
 * Credential provider for headless logins. The phone number comes from configuration; the login
 * code and the second-factor password are each read once from their own file through a
 * CredentialGate created when the transport asks for it.
 */
class FileAuthenticator final : public messenger::ICredentialProvider {
public:
    FileAuthenticator(const config::AgentConfig& config,
                      std::shared_ptr<IClock> clock = systemClock(),
                      std::chrono::milliseconds pollInterval = kPollInterval);

    std::string phoneNumber() const override { return phone_; }
    Result<std::string> code(const ShouldCancel& shouldCancel) override;
    Result<std::string> password(const ShouldCancel& shouldCancel) override;

private:
    Result<std::string> acquire(const std::filesystem::path& path, std::string_view what,
                                std::string_view example, const ShouldCancel& shouldCancel);

    std::string phone_;
    std::filesystem::path codeFile_;
    std::filesystem::path passwordFile_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<IClock> clock_;
    std::chrono::milliseconds pollInterval_;
};

} // namespace docdrop::auth
