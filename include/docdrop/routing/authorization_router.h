#pragma once

#include <docdrop/messenger/messenger.h>

#include <optional>
#include <variant>

namespace docdrop::config {
struct AgentConfig;
}

namespace docdrop::routing {

// One-to-one conversations with the allowed user.
struct DirectMode {};

// Posts inside one channel or group.
struct ContainerMode {
    messenger::ChatId containerId{0};
};

using RoutingStrategy = std::variant<DirectMode, ContainerMode>;

RoutingStrategy strategyFor(const config::AgentConfig& config);

// An update that passed every check and carries a document.
struct Accepted {
    messenger::PeerRef replyTo;
    messenger::UserId senderId{0};
    messenger::MessageId messageId{0};
    messenger::InboundDocument document;
};

enum class RouteVerdict { Accepted, WrongOrigin, NoSender, Unauthorized, NoDocument };

const char* toString(RouteVerdict verdict);

struct RouteResult {
    RouteVerdict verdict{RouteVerdict::WrongOrigin};
    std::optional<Accepted> accepted;
};

/**
 * Filters inbound updates down to documents sent by the single allowed user. The strategy is
 * fixed for the router's lifetime. Rejections are ordinary results, never errors.
 */
class AuthorizationRouter {
public:
    AuthorizationRouter(RoutingStrategy strategy, messenger::UserId allowedUser)
        : strategy_(strategy), allowedUser_(allowedUser) {}

    RouteResult classify(const messenger::InboundUpdate& update) const;

    std::optional<Accepted> route(const messenger::InboundUpdate& update) const {
        return classify(update).accepted;
    }

    const RoutingStrategy& strategy() const noexcept { return strategy_; }
    messenger::UserId allowedUser() const noexcept { return allowedUser_; }

private:
    RoutingStrategy strategy_;
    messenger::UserId allowedUser_;
};

} // namespace docdrop::routing
