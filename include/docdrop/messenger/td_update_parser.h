#pragma once

#include <docdrop/messenger/messenger.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace docdrop::messenger::td {

using json = nlohmann::json;

enum class ChatKind { Private, Secret, BasicGroup, Supergroup, Channel, Unknown };

// Reads an integer that TDLib may encode as a number or, for 64-bit values, a string.
std::optional<std::int64_t> readInt(const json& obj, const char* key);

/**
 * What the client has learned about chats and users from updateNewChat / updateUser. Needed
 * because messages only carry a chat id.
 */
class ChatIndex {
public:
    // Returns true when the update was one the index tracks.
    bool apply(const json& update);

    void addChat(ChatId chatId, ChatKind kind, std::optional<UserId> user = std::nullopt);
    void addUser(UserEntity user);

    ChatKind kindOf(ChatId chatId) const;
    std::optional<ChatId> privateChatFor(UserId user) const;
    std::optional<UserId> userForChat(ChatId chatId) const;
    std::optional<UserEntity> user(UserId id) const;

private:
    struct ChatInfo {
        ChatKind kind{ChatKind::Unknown};
        std::optional<UserId> user;
    };
    std::unordered_map<ChatId, ChatInfo> chats_;
    std::unordered_map<UserId, ChatId> privateChats_;
    std::unordered_map<UserId, UserEntity> users_;
};

ChatKind parseChatType(const json& type);
UserEntity parseUser(const json& user);

// message object -> update; nullopt for outgoing messages and non-message objects.
std::optional<InboundUpdate> parseMessage(const json& message, const ChatIndex& index);

// Download state of one file object.
struct FileState {
    std::int32_t id{0};
    std::uint64_t size{0};
    std::string localPath;
    std::uint64_t downloadedPrefix{0};
    bool downloading{false};
    bool completed{false};
};

std::optional<FileState> parseFile(const json& file);

// True for the authorization states after which the client delivers no more updates.
bool endsSession(std::string_view authorizationState);

// "error" object -> Error with a best-effort ErrorCode.
Error toError(const json& error);

} // namespace docdrop::messenger::td
