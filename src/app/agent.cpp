#include <docdrop/app/agent.h>
#include <docdrop/config/config_helpers.h>
#include <docdrop/download/format.h>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>

namespace docdrop::app {

using messenger::PeerRef;

Agent::Agent(config::AgentConfig config, messenger::IMessengerClient& client,
             messenger::ICredentialProvider& credentials, std::shared_ptr<IClock> clock)
    : config_(std::move(config)), client_(client), credentials_(credentials),
      clock_(clock ? std::move(clock) : systemClock()),
      router_(routing::strategyFor(config_), config_.allowedUserId),
      orchestrator_(client_, download::DownloadPolicy::fromConfig(config_), clock_) {}

Result<void> Agent::start() {
    if (auto r = client_.authenticate(credentials_, cancellation()); !r) {
        return Error{r.error().code, "authentication failed: " + r.error().message};
    }
    spdlog::info("Authentication successful!");

    auto me = client_.self();
    if (!me) {
        return Error{me.error().code, "failed to get current user: " + me.error().message};
    }
    spdlog::info("Logged in as: {} {} (ID: {})", me.value().firstName, me.value().lastName,
                 me.value().id);

    sendGreeting();

    if (auto r = client_.startUpdates(queue_); !r) {
        return Error{r.error().code, "failed to subscribe to updates: " + r.error().message};
    }
    spdlog::info("Agent is running... Monitoring for documents");
    return {};
}

std::string Agent::greetingText() const {
    const auto now = std::time(nullptr);
    std::string text = fmt::format("[{:%Y-%m-%d %H:%M:%S}] Hi, show me the docs!\n\n📋 File size "
                                   "limit: {}",
                                   fmt::localtime(now),
                                   download::formatBytes(config_.maxFileBytes));
    if (!config_.allowedExtensions.empty()) {
        text += "\n📎 Allowed types: " + config::join(config_.allowedExtensions);
    } else {
        text += "\n📎 All file types accepted";
    }
    return text;
}

void Agent::logGreetingHints() const {
    spdlog::info("💡 Use channel mode (--channel) for a reliable greeting, or:");
    spdlog::info("   1. Add user {} to this account's contacts, OR", config_.allowedUserId);
    spdlog::info("   2. Send any message from that user to this account first");
}

void Agent::sendGreeting() {
    const auto text = greetingText();

    if (config_.containerId) {
        if (auto r = client_.sendText(PeerRef::container(*config_.containerId), text); !r) {
            spdlog::warn("Could not send greeting to channel: {}", r.error().message);
            spdlog::info("💡 Make sure:");
            spdlog::info("   1. This account is a member of the channel/group");
            spdlog::info("   2. Channel ID is correct (use negative ID for supergroups)");
            return;
        }
        spdlog::info("Sent greeting to channel {}", *config_.containerId);
        return;
    }

    auto contacts = client_.fetchContacts();
    if (!contacts) {
        spdlog::warn("Greeting skipped: could not fetch contacts ({})",
                     contacts.error().message);
        logGreetingHints();
        return;
    }
    const auto& users = contacts.value();
    auto it = std::find_if(users.begin(), users.end(), [this](const messenger::UserEntity& u) {
        return u.id == config_.allowedUserId;
    });
    if (it == users.end()) {
        spdlog::info("Greeting skipped: user {} not in contacts", config_.allowedUserId);
        logGreetingHints();
        return;
    }

    if (auto r = client_.sendText(PeerRef::user(it->id, it->accessKey), text); !r) {
        spdlog::warn("Could not send greeting: {}", r.error().message);
        return;
    }
    spdlog::info("Sent greeting to user {}", config_.allowedUserId);
}

Result<void> Agent::handleUpdate(const messenger::InboundUpdate& update) {
    ++stats_.updates;
    auto accepted = router_.route(update);
    if (!accepted) {
        ++stats_.ignored;
        return {};
    }

    auto outcome = orchestrator_.handle(*accepted, cancellation());
    if (!outcome) {
        if (orchestrator_.lastStage() == download::DownloadStage::Rejected) {
            ++stats_.rejected;
        } else {
            ++stats_.failed;
        }
        return outcome.error();
    }
    ++stats_.downloaded;
    return {};
}

void Agent::run(std::chrono::milliseconds pollTimeout) {
    while (!stopRequested()) {
        auto update = queue_.pop(pollTimeout);
        if (!update) {
            if (queue_.closed()) {
                spdlog::info("Update stream closed");
                break;
            }
            continue;
        }
        if (auto r = handleUpdate(*update); !r) {
            spdlog::error("Error handling message {}: {}", update->messageId, r.error().message);
        }
    }
    spdlog::info("Dispatch loop stopped ({} updates, {} downloaded, {} rejected, {} failed)",
                 stats_.updates, stats_.downloaded, stats_.rejected, stats_.failed);
}

} // namespace docdrop::app
