#include <docdrop/config/agent_config.h>
#include <docdrop/routing/authorization_router.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace docdrop::routing {

using messenger::InboundUpdate;
using messenger::OriginKind;
using messenger::PeerRef;

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::int64_t accessKeyFor(const InboundUpdate& update, messenger::UserId user) {
    auto it = std::find_if(update.entities.begin(), update.entities.end(),
                           [user](const messenger::UserEntity& e) { return e.id == user; });
    return it != update.entities.end() ? it->accessKey : 0;
}

// Sender identity and reply destination of a matching update.
struct Resolved {
    messenger::UserId sender;
    PeerRef replyTo;
};

} // namespace

RoutingStrategy strategyFor(const config::AgentConfig& config) {
    if (config.containerId) {
        return ContainerMode{*config.containerId};
    }
    return DirectMode{};
}

const char* toString(RouteVerdict verdict) {
    switch (verdict) {
        case RouteVerdict::Accepted: return "accepted";
        case RouteVerdict::WrongOrigin: return "wrong origin";
        case RouteVerdict::NoSender: return "no sender";
        case RouteVerdict::Unauthorized: return "unauthorized sender";
        case RouteVerdict::NoDocument: return "no document";
    }
    return "unknown";
}

RouteResult AuthorizationRouter::classify(const InboundUpdate& update) const {
    RouteResult result;

    std::optional<Resolved> resolved = std::visit(
        overloaded{
            [&](const ContainerMode& mode) -> std::optional<Resolved> {
                if (update.origin.kind != OriginKind::Container ||
                    update.origin.peerId != mode.containerId) {
                    return std::nullopt;
                }
                if (!update.senderId) {
                    result.verdict = RouteVerdict::NoSender;
                    return std::nullopt;
                }
                return Resolved{*update.senderId, PeerRef::container(mode.containerId)};
            },
            [&](const DirectMode&) -> std::optional<Resolved> {
                if (update.origin.kind != OriginKind::DirectMessage) {
                    return std::nullopt;
                }
                const auto peer = update.origin.peerId;
                return Resolved{peer, PeerRef::user(peer, accessKeyFor(update, peer))};
            }},
        strategy_);

    if (!resolved) {
        if (result.verdict == RouteVerdict::NoSender) {
            spdlog::debug("Ignoring message {} in container without sender", update.messageId);
        }
        return result;
    }

    if (resolved->sender != allowedUser_) {
        spdlog::info("Ignoring message from unauthorized user {}", resolved->sender);
        result.verdict = RouteVerdict::Unauthorized;
        return result;
    }

    if (!update.document) {
        spdlog::debug("Message {} from user {} has no document", update.messageId,
                      resolved->sender);
        result.verdict = RouteVerdict::NoDocument;
        return result;
    }

    result.verdict = RouteVerdict::Accepted;
    result.accepted = Accepted{resolved->replyTo, resolved->sender, update.messageId,
                               *update.document};
    return result;
}

} // namespace docdrop::routing
