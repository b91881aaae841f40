#pragma once

#include <docdrop/core/clock.h>
#include <docdrop/messenger/messenger.h>
#include <docdrop/routing/authorization_router.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace docdrop::config {
struct AgentConfig;
}

namespace docdrop::download {

struct DownloadPolicy {
    std::filesystem::path downloadRoot;
    std::vector<std::string> allowedExtensions; // empty = everything
    std::uint64_t maxFileBytes{0};              // 0 = no ceiling
    std::chrono::milliseconds progressInterval{std::chrono::seconds(2)};

    static DownloadPolicy fromConfig(const config::AgentConfig& config);

    bool extensionAllowed(const std::string& extension) const;
};

enum class DownloadStage {
    Validating,
    Naming,
    Announcing,
    Streaming,
    Finalizing,
    Done,
    Rejected,
    Failed
};

const char* toString(DownloadStage stage);

struct DownloadOutcome {
    std::filesystem::path path;
    std::uint64_t bytes{0};
    std::chrono::milliseconds elapsed{0};
};

/**
 * Drives one accepted document from validation to the final status message.
 *
 *   Validating -> Naming -> Announcing -> Streaming -> Finalizing -> Done
 *
 * Validation failures end in Rejected after exactly one explanatory message. Any later failure
 * ends in Failed with a status edit naming network, disk, size or shutdown as the cause. A
 * partially written file is left in place. Errors are returned, never thrown.
 */
class DownloadOrchestrator {
public:
    DownloadOrchestrator(messenger::IMessengerClient& client, DownloadPolicy policy,
                         std::shared_ptr<IClock> clock = systemClock());

    Result<DownloadOutcome> handle(const routing::Accepted& accepted,
                                   const ShouldCancel& shouldCancel = {});

    DownloadStage lastStage() const noexcept { return stage_; }
    const DownloadPolicy& policy() const noexcept { return policy_; }

private:
    void enter(DownloadStage stage, const std::string& name);
    void reply(const messenger::PeerRef& peer, const std::string& text);
    void edit(const messenger::StatusTarget& target, const std::string& text);

    messenger::IMessengerClient& client_;
    DownloadPolicy policy_;
    std::shared_ptr<IClock> clock_;
    DownloadStage stage_{DownloadStage::Validating};
};

} // namespace docdrop::download
