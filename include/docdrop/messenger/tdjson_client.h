#pragma once

#include <docdrop/messenger/messenger.h>
#include <docdrop/messenger/send_tracker.h>
#include <docdrop/messenger/td_update_parser.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace docdrop::messenger {

struct TdJsonOptions {
    std::int32_t apiId{0};
    std::string apiHash;
    std::filesystem::path databaseDirectory{"session"};
    int logVerbosity{1};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
};

/**
 * IMessengerClient over TDLib's JSON interface (td_json_client.h).
 *
 * One receive thread owns td_receive(). Responses carrying "@extra" complete the matching
 * request; everything else is an update that either maintains the chat index, advances the
 * authorization state, tracks file downloads and message sends, or becomes an InboundUpdate.
 */
class TdJsonClient final : public IMessengerClient {
public:
    explicit TdJsonClient(TdJsonOptions options);
    ~TdJsonClient() override;

    TdJsonClient(const TdJsonClient&) = delete;
    TdJsonClient& operator=(const TdJsonClient&) = delete;

    Result<void> authenticate(ICredentialProvider& credentials,
                              const ShouldCancel& shouldCancel) override;
    Result<UserEntity> self() override;
    Result<MessageId> sendText(const PeerRef& peer, std::string_view text) override;
    Result<void> editText(const PeerRef& peer, MessageId messageId,
                          std::string_view text) override;
    Result<void> streamDocument(const DocumentLocator& locator, const ByteSink& sink,
                                const ShouldCancel& shouldCancel) override;
    Result<std::vector<UserEntity>> fetchContacts() override;
    Result<void> startUpdates(UpdateQueue& queue) override;
    void shutdown() override;

private:
    using json = nlohmann::json;

    Result<json> request(json query);
    Result<json> request(json query, std::chrono::milliseconds timeout);
    void sendRaw(const json& query);

    void receiveLoop();
    void dispatch(json object);

    std::optional<std::string> nextAuthState(std::chrono::milliseconds timeout);
    Result<ChatId> resolveChat(const PeerRef& peer);
    std::optional<td::FileState> waitFileUpdate(std::int32_t fileId, std::uint64_t& seen,
                                                std::chrono::milliseconds timeout);

    TdJsonOptions options_;
    int clientId_{0};
    std::atomic<bool> running_{false};
    std::thread receiver_;

    std::mutex requestMutex_;
    std::uint64_t nextRequestId_{0};
    std::unordered_map<std::uint64_t, std::promise<json>> pending_;

    std::mutex authMutex_;
    std::condition_variable authCv_;
    std::deque<std::string> authStates_;
    bool closed_{false};

    mutable std::mutex indexMutex_;
    td::ChatIndex index_;
    UpdateQueue* queue_{nullptr};

    SendTracker sends_;

    std::mutex fileMutex_;
    std::condition_variable fileCv_;
    std::unordered_map<std::int32_t, td::FileState> files_;
    std::unordered_map<std::int32_t, std::uint64_t> fileVersions_;
};

} // namespace docdrop::messenger
