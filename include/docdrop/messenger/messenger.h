#pragma once

#include <docdrop/core/clock.h>
#include <docdrop/core/types.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docdrop::messenger {

class UpdateQueue;

using UserId = std::int64_t;
using ChatId = std::int64_t;
using MessageId = std::int64_t;

enum class PeerKind { User, Container };

// Addressable destination. accessKey is the secondary credential some transports need to
// address a user; 0 when unknown.
struct PeerRef {
    PeerKind kind{PeerKind::User};
    std::int64_t id{0};
    std::int64_t accessKey{0};

    static PeerRef user(UserId id, std::int64_t accessKey = 0) {
        return PeerRef{PeerKind::User, id, accessKey};
    }
    static PeerRef container(ChatId id) { return PeerRef{PeerKind::Container, id, 0}; }
};

struct UserEntity {
    UserId id{0};
    std::int64_t accessKey{0};
    std::string firstName;
    std::string lastName;
    std::string username;
};

// Opaque to everything except the transport that produced it.
struct DocumentLocator {
    std::int64_t fileId{0};
    std::string remoteId;
};

struct InboundDocument {
    std::optional<std::string> fileName;
    std::uint64_t size{0};
    std::int64_t documentId{0};
    std::string mimeType;
    DocumentLocator locator;

    // Declared name, or document_<id> when the sender attached none.
    std::string displayName() const {
        if (fileName && !fileName->empty()) {
            return *fileName;
        }
        return "document_" + std::to_string(documentId);
    }
};

enum class OriginKind { DirectMessage, Container, Other };

struct MessageOrigin {
    OriginKind kind{OriginKind::Other};
    std::int64_t peerId{0};
};

struct InboundUpdate {
    MessageId messageId{0};
    MessageOrigin origin;
    std::optional<UserId> senderId;
    std::optional<InboundDocument> document;
    std::vector<UserEntity> entities;
};

// Where progress and outcome text for one document goes. Without a message id, edits are
// no-ops.
struct StatusTarget {
    PeerRef peer;
    std::optional<MessageId> messageId;

    bool isNull() const noexcept { return !messageId.has_value(); }
};

using ByteSink = std::function<Result<void>(ByteSpan)>;

/**
 * Supplies the secrets a login handshake needs. code() and password() may block for a long
 * time; both honour the cancellation predicate.
 */
class ICredentialProvider {
public:
    virtual ~ICredentialProvider() = default;

    virtual std::string phoneNumber() const = 0;
    virtual Result<std::string> code(const ShouldCancel& shouldCancel) = 0;
    virtual Result<std::string> password(const ShouldCancel& shouldCancel) = 0;
};

/**
 * Abstract transport boundary. Implementations translate their own wire objects into the
 * domain types above; nothing outside the implementation sees protocol details.
 */
class IMessengerClient {
public:
    virtual ~IMessengerClient() = default;

    // Log in (or resume a persisted session). Blocks until ready or failed.
    virtual Result<void> authenticate(ICredentialProvider& credentials,
                                      const ShouldCancel& shouldCancel) = 0;

    // The authenticated account.
    virtual Result<UserEntity> self() = 0;

    // Returns the id later edits must use.
    virtual Result<MessageId> sendText(const PeerRef& peer, std::string_view text) = 0;

    virtual Result<void> editText(const PeerRef& peer, MessageId messageId,
                                  std::string_view text) = 0;

    // Push the document's bytes, in order, into sink. A sink error aborts the stream and is
    // returned unchanged.
    virtual Result<void> streamDocument(const DocumentLocator& locator, const ByteSink& sink,
                                        const ShouldCancel& shouldCancel) = 0;

    virtual Result<std::vector<UserEntity>> fetchContacts() = 0;

    // Start delivering updates onto queue. Called once, after authenticate().
    virtual Result<void> startUpdates(UpdateQueue& queue) = 0;

    virtual void shutdown() = 0;
};

} // namespace docdrop::messenger
