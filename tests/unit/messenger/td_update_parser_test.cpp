#include <gtest/gtest.h>

#include <docdrop/messenger/td_update_parser.h>

#include <nlohmann/json.hpp>

using namespace docdrop;
using namespace docdrop::messenger;
using namespace docdrop::messenger::td;
using json = nlohmann::json;

namespace {

json documentMessage(std::int64_t chatId, json sender, bool outgoing = false) {
    json msg = json::parse(R"({
        "@type": "message",
        "id": 4194304,
        "chat_id": 0,
        "is_outgoing": false,
        "content": {
            "@type": "messageDocument",
            "document": {
                "@type": "document",
                "file_name": "Report.PDF",
                "mime_type": "application/pdf",
                "document": {
                    "@type": "file",
                    "id": 17,
                    "size": 123456,
                    "expected_size": 123456,
                    "local": {"@type": "localFile", "path": "", "downloaded_prefix_size": 0,
                              "is_downloading_active": false, "is_downloading_completed": false},
                    "remote": {"@type": "remoteFile", "id": "BQACAgIAAxkBAAI", "unique_id": "AgAD"}
                }
            }
        }
    })");
    msg["chat_id"] = chatId;
    msg["sender_id"] = std::move(sender);
    msg["is_outgoing"] = outgoing;
    return msg;
}

json userSender(std::int64_t id) {
    return {{"@type", "messageSenderUser"}, {"user_id", id}};
}

json newChat(std::int64_t id, json type) {
    return {{"@type", "updateNewChat"}, {"chat", {{"@type", "chat"}, {"id", id}, {"type", type}}}};
}

} // namespace

// =============================================================================
// Message translation
// =============================================================================

TEST(TdUpdateParserTest, PrivateChatDocumentBecomesDirectMessage) {
    ChatIndex index;
    ASSERT_TRUE(index.apply(newChat(777, {{"@type", "chatTypePrivate"}, {"user_id", 777}})));
    ASSERT_TRUE(index.apply(json{{"@type", "updateUser"},
                                 {"user",
                                  {{"@type", "user"},
                                   {"id", 777},
                                   {"first_name", "Ada"},
                                   {"last_name", "Lovelace"},
                                   {"usernames", {{"active_usernames", {"ada"}}}}}}}));

    auto update = parseMessage(documentMessage(777, userSender(777)), index);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->messageId, 4194304);
    EXPECT_EQ(update->origin.kind, OriginKind::DirectMessage);
    EXPECT_EQ(update->origin.peerId, 777);
    EXPECT_EQ(update->senderId, 777);
    ASSERT_EQ(update->entities.size(), 1u);
    EXPECT_EQ(update->entities[0].firstName, "Ada");
    EXPECT_EQ(update->entities[0].username, "ada");

    ASSERT_TRUE(update->document);
    const auto& doc = *update->document;
    EXPECT_EQ(doc.fileName, "Report.PDF");
    EXPECT_EQ(doc.mimeType, "application/pdf");
    EXPECT_EQ(doc.size, 123456u);
    EXPECT_EQ(doc.locator.fileId, 17);
    EXPECT_EQ(doc.locator.remoteId, "BQACAgIAAxkBAAI");
}

TEST(TdUpdateParserTest, SupergroupMessageBecomesContainerOrigin) {
    ChatIndex index;
    index.apply(newChat(-1001234567890,
                        {{"@type", "chatTypeSupergroup"}, {"supergroup_id", 1234567890},
                         {"is_channel", false}}));

    auto update = parseMessage(documentMessage(-1001234567890, userSender(42)), index);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->origin.kind, OriginKind::Container);
    EXPECT_EQ(update->origin.peerId, -1001234567890);
    EXPECT_EQ(update->senderId, 42);
    EXPECT_EQ(index.kindOf(-1001234567890), ChatKind::Supergroup);
}

TEST(TdUpdateParserTest, ChannelPostHasNoUserSender) {
    ChatIndex index;
    index.apply(newChat(-1009, {{"@type", "chatTypeSupergroup"}, {"is_channel", true}}));
    json sender = {{"@type", "messageSenderChat"}, {"chat_id", -1009}};

    auto update = parseMessage(documentMessage(-1009, sender), index);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->origin.kind, OriginKind::Container);
    EXPECT_FALSE(update->senderId.has_value());
    EXPECT_EQ(index.kindOf(-1009), ChatKind::Channel);
}

TEST(TdUpdateParserTest, UnknownChatFallsBackToIdSign) {
    ChatIndex index;
    auto positive = parseMessage(documentMessage(555, userSender(555)), index);
    auto negative = parseMessage(documentMessage(-555, userSender(1)), index);
    ASSERT_TRUE(positive && negative);
    EXPECT_EQ(positive->origin.kind, OriginKind::DirectMessage);
    EXPECT_EQ(negative->origin.kind, OriginKind::Container);
}

TEST(TdUpdateParserTest, OutgoingAndForeignObjectsAreSkipped) {
    ChatIndex index;
    EXPECT_FALSE(parseMessage(documentMessage(777, userSender(1000), true), index));
    EXPECT_FALSE(parseMessage(json{{"@type", "chat"}, {"id", 1}}, index));
    EXPECT_FALSE(parseMessage(json::array(), index));
}

TEST(TdUpdateParserTest, TextMessageHasNoDocument) {
    ChatIndex index;
    json msg = documentMessage(777, userSender(777));
    msg["content"] = {{"@type", "messageText"},
                      {"text", {{"@type", "formattedText"}, {"text", "hi"}}}};
    auto update = parseMessage(msg, index);
    ASSERT_TRUE(update);
    EXPECT_FALSE(update->document);
}

TEST(TdUpdateParserTest, MissingFileNameLeavesDisplayNameSynthesized) {
    ChatIndex index;
    json msg = documentMessage(777, userSender(777));
    msg["content"]["document"]["file_name"] = "";
    auto update = parseMessage(msg, index);
    ASSERT_TRUE(update && update->document);
    EXPECT_FALSE(update->document->fileName.has_value());
    EXPECT_EQ(update->document->displayName(), "document_17");
}

// =============================================================================
// Index and scalar helpers
// =============================================================================

TEST(TdUpdateParserTest, IndexPrefersRegularPrivateChat) {
    ChatIndex index;
    index.addChat(9001, ChatKind::Secret, 777);
    EXPECT_EQ(index.privateChatFor(777), 9001);
    index.addChat(777, ChatKind::Private, 777);
    EXPECT_EQ(index.privateChatFor(777), 777);
    index.addChat(9002, ChatKind::Secret, 777);
    EXPECT_EQ(index.privateChatFor(777), 777);
    EXPECT_FALSE(index.privateChatFor(1).has_value());
}

TEST(TdUpdateParserTest, ReadIntAcceptsNumbersAndStrings) {
    json obj = {{"a", 5}, {"b", "-9000000000000"}, {"c", "x1"}, {"d", true}};
    EXPECT_EQ(readInt(obj, "a"), 5);
    EXPECT_EQ(readInt(obj, "b"), -9000000000000LL);
    EXPECT_FALSE(readInt(obj, "c"));
    EXPECT_FALSE(readInt(obj, "d"));
    EXPECT_FALSE(readInt(obj, "missing"));
}

TEST(TdUpdateParserTest, ParsesFileDownloadState) {
    json file = {{"@type", "file"},
                 {"id", 17},
                 {"size", 0},
                 {"expected_size", 4096},
                 {"local",
                  {{"@type", "localFile"},
                   {"path", "/tmp/td/documents/a.pdf"},
                   {"downloaded_prefix_size", 1024},
                   {"is_downloading_active", true},
                   {"is_downloading_completed", false}}}};
    auto state = parseFile(file);
    ASSERT_TRUE(state);
    EXPECT_EQ(state->id, 17);
    EXPECT_EQ(state->size, 4096u);
    EXPECT_EQ(state->localPath, "/tmp/td/documents/a.pdf");
    EXPECT_EQ(state->downloadedPrefix, 1024u);
    EXPECT_TRUE(state->downloading);
    EXPECT_FALSE(state->completed);

    EXPECT_FALSE(parseFile(json{{"@type", "document"}}));
}

TEST(TdUpdateParserTest, ErrorObjectsMapToErrorCodes) {
    auto err = toError(json{{"@type", "error"}, {"code", 400}, {"message", "PHONE_CODE_INVALID"}});
    EXPECT_EQ(err.code, ErrorCode::InvalidArgument);
    EXPECT_NE(err.message.find("PHONE_CODE_INVALID"), std::string::npos);

    EXPECT_EQ(toError(json{{"code", 401}}).code, ErrorCode::Unauthorized);
    EXPECT_EQ(toError(json{{"code", 500}, {"message", "x"}}).code, ErrorCode::NetworkError);
}

TEST(TdUpdateParserTest, ParseUserSupportsLegacyUsername) {
    auto user = parseUser(json{{"id", 5}, {"first_name", "Bo"}, {"username", "bo"}});
    EXPECT_EQ(user.id, 5);
    EXPECT_EQ(user.firstName, "Bo");
    EXPECT_EQ(user.username, "bo");
}

TEST(TdUpdateParserTest, ClosingStatesEndTheSession) {
    EXPECT_TRUE(endsSession("authorizationStateClosed"));
    EXPECT_TRUE(endsSession("authorizationStateClosing"));
    EXPECT_TRUE(endsSession("authorizationStateLoggingOut"));
    EXPECT_FALSE(endsSession("authorizationStateReady"));
    EXPECT_FALSE(endsSession("authorizationStateWaitCode"));
    EXPECT_FALSE(endsSession(""));
}
