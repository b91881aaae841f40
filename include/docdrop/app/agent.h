#pragma once

#include <docdrop/config/agent_config.h>
#include <docdrop/core/clock.h>
#include <docdrop/download/download_orchestrator.h>
#include <docdrop/messenger/messenger.h>
#include <docdrop/messenger/update_queue.h>
#include <docdrop/routing/authorization_router.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace docdrop::app {

struct AgentStats {
    std::size_t updates{0};
    std::size_t ignored{0};
    std::size_t downloaded{0};
    std::size_t rejected{0};
    std::size_t failed{0};
};

/**
 * Process-level sequencing around one messenger client:
 *   start()  authenticate, identify, greet, subscribe
 *   run()    pop updates until stopped, route, download
 * Per-update failures are logged and counted; they never end the loop.
 */
class Agent {
public:
    Agent(config::AgentConfig config, messenger::IMessengerClient& client,
          messenger::ICredentialProvider& credentials,
          std::shared_ptr<IClock> clock = systemClock());

    Result<void> start();
    void run(std::chrono::milliseconds pollTimeout = std::chrono::milliseconds(250));

    // Route one update and, when accepted, download it synchronously.
    Result<void> handleUpdate(const messenger::InboundUpdate& update);

    std::string greetingText() const;
    // Best effort; failures are logged with operator hints, never returned.
    void sendGreeting();

    // Async-signal-safe.
    void requestStop() noexcept { stop_.store(true, std::memory_order_relaxed); }
    bool stopRequested() const noexcept { return stop_.load(std::memory_order_relaxed); }
    ShouldCancel cancellation() const {
        return [this] { return stopRequested(); };
    }

    messenger::UpdateQueue& queue() noexcept { return queue_; }
    const AgentStats& stats() const noexcept { return stats_; }
    const config::AgentConfig& config() const noexcept { return config_; }

private:
    void logGreetingHints() const;

    config::AgentConfig config_;
    messenger::IMessengerClient& client_;
    messenger::ICredentialProvider& credentials_;
    std::shared_ptr<IClock> clock_;
    routing::AuthorizationRouter router_;
    download::DownloadOrchestrator orchestrator_;
    messenger::UpdateQueue queue_;
    AgentStats stats_;
    std::atomic<bool> stop_{false};
};

} // namespace docdrop::app
