#include <docdrop/messenger/td_update_parser.h>

#include <fmt/format.h>

namespace docdrop::messenger::td {

namespace {

std::string readString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

bool readBool(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

std::string typeOf(const json& obj) {
    return obj.is_object() ? readString(obj, "@type") : std::string{};
}

std::optional<InboundDocument> parseDocument(const json& content) {
    if (typeOf(content) != "messageDocument") {
        return std::nullopt;
    }
    auto docIt = content.find("document");
    if (docIt == content.end() || !docIt->is_object()) {
        return std::nullopt;
    }
    const json& doc = *docIt;
    auto fileIt = doc.find("document");
    if (fileIt == doc.end() || !fileIt->is_object()) {
        return std::nullopt;
    }
    auto file = parseFile(*fileIt);
    if (!file) {
        return std::nullopt;
    }

    InboundDocument out;
    if (auto name = readString(doc, "file_name"); !name.empty()) {
        out.fileName = std::move(name);
    }
    out.mimeType = readString(doc, "mime_type");
    out.size = file->size;
    out.documentId = file->id;
    out.locator.fileId = file->id;
    if (auto remote = fileIt->find("remote"); remote != fileIt->end() && remote->is_object()) {
        out.locator.remoteId = readString(*remote, "id");
    }
    return out;
}

} // namespace

std::optional<std::int64_t> readInt(const json& obj, const char* key) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        try {
            std::size_t pos = 0;
            auto v = std::stoll(s, &pos);
            if (pos == s.size()) {
                return static_cast<std::int64_t>(v);
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// ---------- ChatIndex ----------

bool ChatIndex::apply(const json& update) {
    const auto type = typeOf(update);
    if (type == "updateNewChat") {
        const auto& chat = update.value("chat", json::object());
        auto id = readInt(chat, "id");
        if (!id) {
            return false;
        }
        const auto& chatType = chat.value("type", json::object());
        const auto kind = parseChatType(chatType);
        std::optional<UserId> user;
        if (kind == ChatKind::Private || kind == ChatKind::Secret) {
            user = readInt(chatType, "user_id");
        }
        addChat(*id, kind, user);
        return true;
    }
    if (type == "updateUser") {
        const auto& user = update.value("user", json::object());
        if (!readInt(user, "id")) {
            return false;
        }
        addUser(parseUser(user));
        return true;
    }
    return false;
}

void ChatIndex::addChat(ChatId chatId, ChatKind kind, std::optional<UserId> user) {
    chats_[chatId] = ChatInfo{kind, user};
    // Prefer the regular private chat over a secret chat with the same user
    if (user && (kind == ChatKind::Private || !privateChats_.count(*user))) {
        privateChats_[*user] = chatId;
    }
}

void ChatIndex::addUser(UserEntity user) {
    const auto id = user.id;
    users_[id] = std::move(user);
}

ChatKind ChatIndex::kindOf(ChatId chatId) const {
    auto it = chats_.find(chatId);
    return it != chats_.end() ? it->second.kind : ChatKind::Unknown;
}

std::optional<ChatId> ChatIndex::privateChatFor(UserId user) const {
    auto it = privateChats_.find(user);
    if (it == privateChats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<UserId> ChatIndex::userForChat(ChatId chatId) const {
    auto it = chats_.find(chatId);
    if (it == chats_.end()) {
        return std::nullopt;
    }
    return it->second.user;
}

std::optional<UserEntity> ChatIndex::user(UserId id) const {
    auto it = users_.find(id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ---------- Object parsers ----------

ChatKind parseChatType(const json& type) {
    const auto t = typeOf(type);
    if (t == "chatTypePrivate")
        return ChatKind::Private;
    if (t == "chatTypeSecret")
        return ChatKind::Secret;
    if (t == "chatTypeBasicGroup")
        return ChatKind::BasicGroup;
    if (t == "chatTypeSupergroup")
        return readBool(type, "is_channel") ? ChatKind::Channel : ChatKind::Supergroup;
    return ChatKind::Unknown;
}

UserEntity parseUser(const json& user) {
    UserEntity out;
    out.id = readInt(user, "id").value_or(0);
    out.firstName = readString(user, "first_name");
    out.lastName = readString(user, "last_name");
    if (auto names = user.find("usernames"); names != user.end() && names->is_object()) {
        auto active = names->find("active_usernames");
        if (active != names->end() && active->is_array() && !active->empty() &&
            active->front().is_string()) {
            out.username = active->front().get<std::string>();
        }
    } else {
        out.username = readString(user, "username");
    }
    return out;
}

std::optional<InboundUpdate> parseMessage(const json& message, const ChatIndex& index) {
    if (typeOf(message) != "message") {
        return std::nullopt;
    }
    auto id = readInt(message, "id");
    auto chatId = readInt(message, "chat_id");
    if (!id || !chatId) {
        return std::nullopt;
    }
    if (readBool(message, "is_outgoing")) {
        return std::nullopt;
    }

    InboundUpdate update;
    update.messageId = *id;

    const auto& sender = message.value("sender_id", json::object());
    if (typeOf(sender) == "messageSenderUser") {
        update.senderId = readInt(sender, "user_id");
    }

    switch (index.kindOf(*chatId)) {
        case ChatKind::Private:
        case ChatKind::Secret:
            update.origin = {OriginKind::DirectMessage,
                             index.userForChat(*chatId).value_or(*chatId)};
            break;
        case ChatKind::BasicGroup:
        case ChatKind::Supergroup:
        case ChatKind::Channel:
            update.origin = {OriginKind::Container, *chatId};
            break;
        case ChatKind::Unknown:
            // Private chat ids equal the user id; group and channel ids are negative
            update.origin = {*chatId > 0 ? OriginKind::DirectMessage : OriginKind::Container,
                             *chatId};
            break;
    }

    if (update.origin.kind == OriginKind::DirectMessage) {
        if (auto u = index.user(update.origin.peerId)) {
            update.entities.push_back(*u);
        }
    }
    if (update.senderId && update.origin.kind == OriginKind::Container) {
        if (auto u = index.user(*update.senderId)) {
            update.entities.push_back(*u);
        }
    }

    if (auto content = message.find("content"); content != message.end()) {
        update.document = parseDocument(*content);
    }
    return update;
}

std::optional<FileState> parseFile(const json& file) {
    if (typeOf(file) != "file") {
        return std::nullopt;
    }
    auto id = readInt(file, "id");
    if (!id) {
        return std::nullopt;
    }
    FileState out;
    out.id = static_cast<std::int32_t>(*id);
    auto size = readInt(file, "size").value_or(0);
    if (size <= 0) {
        size = readInt(file, "expected_size").value_or(0);
    }
    out.size = size > 0 ? static_cast<std::uint64_t>(size) : 0;

    if (auto local = file.find("local"); local != file.end() && local->is_object()) {
        out.localPath = readString(*local, "path");
        const auto prefix = readInt(*local, "downloaded_prefix_size").value_or(0);
        out.downloadedPrefix = prefix > 0 ? static_cast<std::uint64_t>(prefix) : 0;
        out.downloading = readBool(*local, "is_downloading_active");
        out.completed = readBool(*local, "is_downloading_completed");
    }
    return out;
}

bool endsSession(std::string_view authorizationState) {
    return authorizationState == "authorizationStateLoggingOut" ||
           authorizationState == "authorizationStateClosing" ||
           authorizationState == "authorizationStateClosed";
}

Error toError(const json& error) {
    const auto code = readInt(error, "code").value_or(0);
    auto message = readString(error, "message");
    if (message.empty()) {
        message = "unknown error";
    }
    ErrorCode ec = ErrorCode::NetworkError;
    if (code == 400) {
        ec = ErrorCode::InvalidArgument;
    } else if (code == 401) {
        ec = ErrorCode::Unauthorized;
    } else if (code == 403) {
        ec = ErrorCode::PermissionDenied;
    } else if (code == 404) {
        ec = ErrorCode::FileNotFound;
    } else if (code == 406) {
        ec = ErrorCode::InvalidState;
    }
    return Error{ec, fmt::format("{} ({})", message, code)};
}

} // namespace docdrop::messenger::td
