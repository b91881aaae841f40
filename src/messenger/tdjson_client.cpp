#include <docdrop/messenger/tdjson_client.h>
#include <docdrop/messenger/update_queue.h>

#include <spdlog/spdlog.h>
#include <td/telegram/td_json_client.h>

#include <algorithm>
#include <array>
#include <fstream>

namespace docdrop::messenger {

namespace {

constexpr double kReceiveTimeoutSeconds = 1.0;
constexpr auto kPollSlice = std::chrono::milliseconds(250);
constexpr std::size_t kCopyChunk = 64 * 1024;

nlohmann::json textContent(std::string_view text) {
    return {{"@type", "inputMessageText"},
            {"text", {{"@type", "formattedText"}, {"text", std::string(text)}}}};
}

} // namespace

TdJsonClient::TdJsonClient(TdJsonOptions options) : options_(std::move(options)) {
    const json verbosity = {{"@type", "setLogVerbosityLevel"},
                            {"new_verbosity_level", options_.logVerbosity}};
    td_execute(verbosity.dump().c_str());

    clientId_ = td_create_client_id();
    running_ = true;
    receiver_ = std::thread([this] { receiveLoop(); });

    // Any request starts the client and triggers the first authorization state
    sendRaw({{"@type", "getOption"}, {"name", "version"}});
}

TdJsonClient::~TdJsonClient() {
    shutdown();
}

// ---------- Transport plumbing ----------

void TdJsonClient::sendRaw(const json& query) {
    td_send(clientId_, query.dump().c_str());
}

Result<TdJsonClient::json> TdJsonClient::request(json query) {
    return request(std::move(query), options_.requestTimeout);
}

Result<TdJsonClient::json> TdJsonClient::request(json query, std::chrono::milliseconds timeout) {
    if (!running_) {
        return Error{ErrorCode::InvalidState, "client is shut down"};
    }
    std::future<json> future;
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(requestMutex_);
        id = ++nextRequestId_;
        future = pending_[id].get_future();
    }
    const std::string type = query.value("@type", std::string{});
    query["@extra"] = id;
    sendRaw(query);

    if (future.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(requestMutex_);
        pending_.erase(id);
        return Error{ErrorCode::Timeout, type + " timed out"};
    }
    json response;
    try {
        response = future.get();
    } catch (const std::future_error&) {
        return Error{ErrorCode::InvalidState, type + " abandoned during shutdown"};
    }
    if (response.value("@type", std::string{}) == "error") {
        return td::toError(response);
    }
    return response;
}

void TdJsonClient::receiveLoop() {
    while (running_) {
        const char* raw = td_receive(kReceiveTimeoutSeconds);
        if (raw == nullptr || raw[0] == '\0') {
            continue;
        }
        json object = json::parse(raw, nullptr, false);
        if (object.is_discarded() || !object.is_object()) {
            spdlog::warn("Discarding malformed TDLib object");
            continue;
        }
        try {
            dispatch(std::move(object));
        } catch (const json::exception& e) {
            spdlog::warn("Unexpected TDLib object shape: {}", e.what());
        }
    }
}

void TdJsonClient::dispatch(json object) {
    if (auto extra = object.find("@extra"); extra != object.end() && extra->is_number_unsigned()) {
        const auto id = extra->get<std::uint64_t>();
        std::lock_guard<std::mutex> lock(requestMutex_);
        if (auto it = pending_.find(id); it != pending_.end()) {
            it->second.set_value(std::move(object));
            pending_.erase(it);
        }
        return;
    }

    const auto type = object.value("@type", std::string{});
    if (type == "updateAuthorizationState") {
        auto state = object["authorization_state"].value("@type", std::string{});
        spdlog::debug("TDLib authorization state: {}", state);
        if (td::endsSession(state)) {
            // No further updates will arrive; let the dispatch loop finish
            std::lock_guard<std::mutex> lock(indexMutex_);
            if (queue_ != nullptr) {
                spdlog::warn("TDLib session ended ({}), closing update stream", state);
                queue_->close();
            }
        }
        {
            std::lock_guard<std::mutex> lock(authMutex_);
            if (state == "authorizationStateClosed") {
                closed_ = true;
            }
            authStates_.push_back(std::move(state));
        }
        authCv_.notify_all();
        return;
    }

    if (type == "updateNewChat" || type == "updateUser") {
        std::lock_guard<std::mutex> lock(indexMutex_);
        index_.apply(object);
        return;
    }

    if (type == "updateNewMessage") {
        std::lock_guard<std::mutex> lock(indexMutex_);
        if (queue_ == nullptr) {
            return;
        }
        if (auto update = td::parseMessage(object["message"], index_)) {
            if (!queue_->push(std::move(*update))) {
                spdlog::debug("Update queue closed, dropping message");
            }
        }
        return;
    }

    if (type == "updateFile") {
        if (auto state = td::parseFile(object["file"])) {
            {
                std::lock_guard<std::mutex> lock(fileMutex_);
                files_[state->id] = *state;
                ++fileVersions_[state->id];
            }
            fileCv_.notify_all();
        }
        return;
    }

    if (type == "updateMessageSendSucceeded" || type == "updateMessageSendFailed") {
        const auto oldId = td::readInt(object, "old_message_id");
        if (!oldId) {
            return;
        }
        if (type == "updateMessageSendSucceeded") {
            sends_.succeeded(*oldId, td::readInt(object["message"], "id").value_or(*oldId));
        } else {
            sends_.failed(*oldId, td::toError(object.value("error", json::object())).message);
        }
    }
}

// ---------- Authorization ----------

std::optional<std::string> TdJsonClient::nextAuthState(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(authMutex_);
    if (!authCv_.wait_for(lock, timeout, [this] { return !authStates_.empty(); })) {
        return std::nullopt;
    }
    auto state = std::move(authStates_.front());
    authStates_.pop_front();
    return state;
}

Result<void> TdJsonClient::authenticate(ICredentialProvider& credentials,
                                        const ShouldCancel& shouldCancel) {
    while (true) {
        if (cancelled(shouldCancel)) {
            return Error{ErrorCode::OperationCancelled, "authentication cancelled"};
        }
        auto state = nextAuthState(kPollSlice);
        if (!state) {
            continue;
        }

        Result<json> step = json::object();
        if (*state == "authorizationStateReady") {
            return {};
        } else if (*state == "authorizationStateWaitTdlibParameters") {
            std::error_code ec;
            std::filesystem::create_directories(options_.databaseDirectory, ec);
            if (ec) {
                return Error{ErrorCode::IoError, "cannot create session directory " +
                                                     options_.databaseDirectory.string() + ": " +
                                                     ec.message()};
            }
            step = request({{"@type", "setTdlibParameters"},
                            {"database_directory", options_.databaseDirectory.string()},
                            {"use_message_database", false},
                            {"use_secret_chats", false},
                            {"api_id", options_.apiId},
                            {"api_hash", options_.apiHash},
                            {"system_language_code", "en"},
                            {"device_model", "Server"},
                            {"system_version", "Linux"},
                            {"application_version", "1.0"}});
        } else if (*state == "authorizationStateWaitPhoneNumber") {
            spdlog::info("Starting login for {}", credentials.phoneNumber());
            step = request({{"@type", "setAuthenticationPhoneNumber"},
                            {"phone_number", credentials.phoneNumber()}});
        } else if (*state == "authorizationStateWaitCode") {
            auto code = credentials.code(shouldCancel);
            if (!code) {
                return code.error();
            }
            step = request({{"@type", "checkAuthenticationCode"}, {"code", code.value()}});
        } else if (*state == "authorizationStateWaitPassword") {
            spdlog::info("Two-factor authentication is enabled");
            auto password = credentials.password(shouldCancel);
            if (!password) {
                return password.error();
            }
            step = request(
                {{"@type", "checkAuthenticationPassword"}, {"password", password.value()}});
        } else if (*state == "authorizationStateLoggingOut" ||
                   *state == "authorizationStateClosing" ||
                   *state == "authorizationStateClosed") {
            return Error{ErrorCode::InvalidState, "client closed during login (" + *state + ")"};
        } else {
            return Error{ErrorCode::NotSupported, "unsupported login step: " + *state};
        }

        if (!step) {
            // Rejected codes and passwords are not retried; the operator restarts with a new one
            return Error{ErrorCode::Unauthorized,
                         "login step " + *state + " failed: " + step.error().message};
        }
    }
}

// ---------- Requests ----------

Result<UserEntity> TdJsonClient::self() {
    auto me = request({{"@type", "getMe"}});
    if (!me) {
        return me.error();
    }
    auto user = td::parseUser(me.value());
    std::lock_guard<std::mutex> lock(indexMutex_);
    index_.addUser(user);
    return user;
}

Result<ChatId> TdJsonClient::resolveChat(const PeerRef& peer) {
    if (peer.kind == PeerKind::Container) {
        return peer.id;
    }
    {
        std::lock_guard<std::mutex> lock(indexMutex_);
        if (auto chat = index_.privateChatFor(peer.id)) {
            return *chat;
        }
    }
    auto chat = request({{"@type", "createPrivateChat"}, {"user_id", peer.id}, {"force", false}});
    if (!chat) {
        return chat.error();
    }
    auto id = td::readInt(chat.value(), "id");
    if (!id) {
        return Error{ErrorCode::InvalidData, "createPrivateChat returned no chat id"};
    }
    return *id;
}

Result<MessageId> TdJsonClient::sendText(const PeerRef& peer, std::string_view text) {
    auto chat = resolveChat(peer);
    if (!chat) {
        return chat.error();
    }
    auto message = request({{"@type", "sendMessage"},
                            {"chat_id", chat.value()},
                            {"input_message_content", textContent(text)}});
    if (!message) {
        return message.error();
    }
    auto id = td::readInt(message.value(), "id");
    if (!id) {
        return Error{ErrorCode::InvalidData, "sendMessage returned no message id"};
    }
    // The returned id is temporary while the message is pending
    const auto& sendingState = message.value().value("sending_state", json());
    if (sendingState.is_object() &&
        sendingState.value("@type", std::string{}) == "messageSendingStatePending") {
        return sends_.await(*id, options_.requestTimeout);
    }
    return *id;
}

Result<void> TdJsonClient::editText(const PeerRef& peer, MessageId messageId,
                                    std::string_view text) {
    auto chat = resolveChat(peer);
    if (!chat) {
        return chat.error();
    }
    auto edited = request({{"@type", "editMessageText"},
                           {"chat_id", chat.value()},
                           {"message_id", messageId},
                           {"input_message_content", textContent(text)}});
    if (!edited) {
        return edited.error();
    }
    return {};
}

Result<std::vector<UserEntity>> TdJsonClient::fetchContacts() {
    auto users = request({{"@type", "getContacts"}});
    if (!users) {
        return users.error();
    }
    std::vector<UserEntity> out;
    const auto& ids = users.value().value("user_ids", json::array());
    for (const auto& idValue : ids) {
        if (!idValue.is_number_integer()) {
            continue;
        }
        const auto id = idValue.get<std::int64_t>();
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            if (auto known = index_.user(id)) {
                out.push_back(*known);
                continue;
            }
        }
        auto user = request({{"@type", "getUser"}, {"user_id", id}});
        if (!user) {
            spdlog::debug("getUser {} failed: {}", id, user.error().message);
            continue;
        }
        out.push_back(td::parseUser(user.value()));
    }
    return out;
}

// ---------- Streaming download ----------

std::optional<td::FileState> TdJsonClient::waitFileUpdate(std::int32_t fileId,
                                                          std::uint64_t& seen,
                                                          std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(fileMutex_);
    fileCv_.wait_for(lock, timeout, [&] { return fileVersions_[fileId] != seen; });
    seen = fileVersions_[fileId];
    auto it = files_.find(fileId);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> TdJsonClient::streamDocument(const DocumentLocator& locator, const ByteSink& sink,
                                          const ShouldCancel& shouldCancel) {
    const auto fileId = static_cast<std::int32_t>(locator.fileId);
    spdlog::debug("Starting download of file {} (remote {})", fileId,
                  locator.remoteId.empty() ? "unknown" : locator.remoteId);
    auto started = request({{"@type", "downloadFile"},
                            {"file_id", fileId},
                            {"priority", 1},
                            {"offset", 0},
                            {"limit", 0},
                            {"synchronous", false}});
    if (!started) {
        return started.error();
    }
    if (auto state = td::parseFile(started.value())) {
        std::lock_guard<std::mutex> lock(fileMutex_);
        files_[fileId] = *state;
        ++fileVersions_[fileId];
    }

    auto failDownload = [&](Error err) -> Result<void> {
        sendRaw({{"@type", "cancelDownloadFile"}, {"file_id", fileId}, {"only_if_pending", false}});
        return err;
    };

    std::ifstream cache;
    std::string cachePath;
    std::uint64_t copied = 0;
    std::uint64_t seenVersion = 0;
    std::array<char, kCopyChunk> buffer{};

    while (true) {
        if (cancelled(shouldCancel)) {
            return failDownload(Error{ErrorCode::OperationCancelled, "download cancelled"});
        }

        auto state = waitFileUpdate(fileId, seenVersion, kPollSlice);
        if (!state) {
            continue;
        }

        if (!state->localPath.empty() && state->downloadedPrefix > copied) {
            if (!cache.is_open() || cachePath != state->localPath) {
                cache.close();
                cache.open(state->localPath, std::ios::binary);
                cachePath = state->localPath;
                if (!cache) {
                    return failDownload(
                        Error{ErrorCode::IoError, "cannot open cached file " + cachePath});
                }
            }
            cache.clear();
            cache.seekg(static_cast<std::streamoff>(copied));
            while (copied < state->downloadedPrefix) {
                const auto want = static_cast<std::streamsize>(
                    std::min<std::uint64_t>(buffer.size(), state->downloadedPrefix - copied));
                cache.read(buffer.data(), want);
                const auto got = cache.gcount();
                if (got <= 0) {
                    return failDownload(
                        Error{ErrorCode::IoError, "short read from " + cachePath});
                }
                auto written = sink(ByteSpan(reinterpret_cast<const std::byte*>(buffer.data()),
                                             static_cast<std::size_t>(got)));
                if (!written) {
                    return failDownload(written.error());
                }
                copied += static_cast<std::uint64_t>(got);
                if (cancelled(shouldCancel)) {
                    return failDownload(Error{ErrorCode::OperationCancelled, "download cancelled"});
                }
            }
        }

        if (state->completed && copied >= state->downloadedPrefix) {
            break;
        }
        if (!state->downloading && !state->completed) {
            return failDownload(
                Error{ErrorCode::NetworkError, "download stopped before completion"});
        }
    }

    cache.close();
    if (auto removed = request({{"@type", "deleteFile"}, {"file_id", fileId}}); !removed) {
        spdlog::debug("Could not drop cached copy of file {}: {}", fileId,
                      removed.error().message);
    }
    return {};
}

// ---------- Lifecycle ----------

Result<void> TdJsonClient::startUpdates(UpdateQueue& queue) {
    std::lock_guard<std::mutex> lock(indexMutex_);
    queue_ = &queue;
    return {};
}

void TdJsonClient::shutdown() {
    if (!running_.load()) {
        return;
    }
    sendRaw({{"@type", "close"}});
    {
        std::unique_lock<std::mutex> lock(authMutex_);
        if (!authCv_.wait_for(lock, std::chrono::seconds(5), [this] { return closed_; })) {
            spdlog::warn("TDLib did not confirm close within 5s");
        }
    }
    running_ = false;
    if (receiver_.joinable()) {
        receiver_.join();
    }
    {
        std::lock_guard<std::mutex> lock(indexMutex_);
        if (queue_ != nullptr) {
            queue_->close();
            queue_ = nullptr;
        }
    }
    {
        std::lock_guard<std::mutex> lock(requestMutex_);
        pending_.clear();
    }
}

} // namespace docdrop::messenger
