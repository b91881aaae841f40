#include <gtest/gtest.h>

#include <docdrop/app/agent.h>

#include "../../common/fakes.h"
#include "../../common/test_helpers.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace docdrop;
using namespace docdrop::app;
using namespace docdrop::messenger;
using docdrop::tests::FakeMessenger;
using docdrop::tests::ManualClock;
using docdrop::tests::read_file;
using docdrop::tests::TempDir;

namespace {

constexpr UserId kAllowed = 777;

class StaticCredentials final : public ICredentialProvider {
public:
    std::string phoneNumber() const override { return "+15550100"; }
    Result<std::string> code(const ShouldCancel&) override { return std::string("12345"); }
    Result<std::string> password(const ShouldCancel&) override { return std::string("hunter2"); }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

InboundUpdate directDocument(UserId from, std::string name, std::string body,
                             MessageId id = 1) {
    InboundUpdate u;
    u.messageId = id;
    u.origin = {OriginKind::DirectMessage, from};
    u.senderId = from;
    InboundDocument doc;
    doc.fileName = std::move(name);
    doc.size = body.size();
    doc.documentId = id;
    doc.locator.fileId = id;
    u.document = doc;
    return u;
}

} // namespace

class AgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.apiId = 1;
        config.apiHash = "hash";
        config.phone = "+15550100";
        config.allowedUserId = kAllowed;
        config.downloadRoot = dir.path();
    }

    std::unique_ptr<Agent> make() {
        return std::make_unique<Agent>(config, client, credentials, clock);
    }

    TempDir dir;
    config::AgentConfig config;
    FakeMessenger client;
    StaticCredentials credentials;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
};

// =============================================================================
// Start-up
// =============================================================================

TEST_F(AgentTest, StartAuthenticatesGreetsAndSubscribes) {
    config.containerId = -1001234567890;
    auto agent = make();

    auto r = agent->start();
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(client.authCalls, 1);
    EXPECT_EQ(client.subscribed, &agent->queue());

    ASSERT_EQ(client.sent.size(), 1u);
    EXPECT_EQ(client.sent[0].peer.kind, PeerKind::Container);
    EXPECT_EQ(client.sent[0].peer.id, -1001234567890);
    EXPECT_TRUE(contains(client.sent[0].text, "Hi, show me the docs!"));
    EXPECT_EQ(client.contactCalls, 0);
}

TEST_F(AgentTest, AuthenticationFailureStopsStart) {
    client.authHook = [](ICredentialProvider&, const ShouldCancel&) -> Result<void> {
        return Error{ErrorCode::Unauthorized, "PHONE_CODE_INVALID"};
    };
    auto agent = make();

    auto r = agent->start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Unauthorized);
    EXPECT_TRUE(contains(r.error().message, "PHONE_CODE_INVALID"));
    EXPECT_TRUE(client.sent.empty());
    EXPECT_EQ(client.subscribed, nullptr);
}

TEST_F(AgentTest, AuthenticatorReceivesCredentialProvider) {
    std::string seenPhone;
    client.authHook = [&](ICredentialProvider& creds, const ShouldCancel&) -> Result<void> {
        seenPhone = creds.phoneNumber();
        auto code = creds.code({});
        if (!code || code.value() != "12345") {
            return Error{ErrorCode::Unauthorized, "bad code"};
        }
        return {};
    };
    auto agent = make();
    ASSERT_TRUE(agent->start());
    EXPECT_EQ(seenPhone, "+15550100");
}

// =============================================================================
// Greeting
// =============================================================================

TEST_F(AgentTest, GreetingTextListsLimits) {
    config.maxFileBytes = 50 * 1024 * 1024;
    config.allowedExtensions = {"pdf", "docx"};
    auto agent = make();

    const auto text = agent->greetingText();
    EXPECT_EQ(text.front(), '[');
    EXPECT_TRUE(contains(text, "] Hi, show me the docs!\n\n"));
    EXPECT_TRUE(contains(text, "📋 File size limit: 50.0 MB"));
    EXPECT_TRUE(contains(text, "📎 Allowed types: pdf, docx"));
}

TEST_F(AgentTest, GreetingTextWithoutAllowList) {
    auto agent = make();
    const auto text = agent->greetingText();
    EXPECT_TRUE(contains(text, "📋 File size limit: 2.0 GB"));
    EXPECT_TRUE(contains(text, "📎 All file types accepted"));
}

TEST_F(AgentTest, DirectGreetingUsesContactAccessKey) {
    client.contacts = {{12, 1, "Other", "", ""}, {kAllowed, 4242, "Owner", "", "owner"}};
    auto agent = make();

    agent->sendGreeting();
    ASSERT_EQ(client.sent.size(), 1u);
    EXPECT_EQ(client.sent[0].peer.kind, PeerKind::User);
    EXPECT_EQ(client.sent[0].peer.id, kAllowed);
    EXPECT_EQ(client.sent[0].peer.accessKey, 4242);
}

TEST_F(AgentTest, DirectGreetingSkippedWhenUserNotInContacts) {
    client.contacts = {{12, 1, "Other", "", ""}};
    auto agent = make();

    agent->sendGreeting();
    EXPECT_EQ(client.contactCalls, 1);
    EXPECT_TRUE(client.sent.empty());
}

TEST_F(AgentTest, GreetingFailuresDoNotFailStart) {
    client.contactsError = Error{ErrorCode::NetworkError, "timeout"};
    auto agent = make();
    EXPECT_TRUE(agent->start());
    EXPECT_TRUE(client.sent.empty());

    FakeMessenger failing;
    failing.failSend = true;
    config.containerId = -100;
    Agent containerAgent(config, failing, credentials, clock);
    EXPECT_TRUE(containerAgent.start());
    EXPECT_NE(failing.subscribed, nullptr);
}

// =============================================================================
// Update handling
// =============================================================================

TEST_F(AgentTest, UnauthorizedSenderProducesNoTraffic) {
    client.chunks = {"payload"};
    auto agent = make();

    ASSERT_TRUE(agent->handleUpdate(directDocument(999, "a.pdf", "payload")));
    EXPECT_TRUE(client.sent.empty());
    EXPECT_TRUE(client.edits.empty());
    EXPECT_TRUE(client.streamed.empty());
    EXPECT_EQ(agent->stats().updates, 1u);
    EXPECT_EQ(agent->stats().ignored, 1u);
}

TEST_F(AgentTest, AllowedDocumentIsDownloaded) {
    client.chunks = {"payload"};
    auto agent = make();

    ASSERT_TRUE(agent->handleUpdate(directDocument(kAllowed, "a.pdf", "payload")));
    EXPECT_EQ(read_file(dir / "a.pdf"), "payload");
    EXPECT_EQ(agent->stats().downloaded, 1u);
    ASSERT_FALSE(client.sent.empty());
    EXPECT_EQ(client.sent[0].peer.id, kAllowed);
}

TEST_F(AgentTest, RejectionsAndFailuresAreCounted) {
    config.allowedExtensions = {"pdf"};
    auto agent = make();

    auto rejected = agent->handleUpdate(directDocument(kAllowed, "tool.exe", "MZ", 1));
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::ValidationError);

    client.chunks = {"x"};
    client.streamError = Error{ErrorCode::NetworkError, "reset"};
    auto failed = agent->handleUpdate(directDocument(kAllowed, "doc.pdf", "xx", 2));
    ASSERT_FALSE(failed);

    EXPECT_EQ(agent->stats().rejected, 1u);
    EXPECT_EQ(agent->stats().failed, 1u);
    EXPECT_EQ(agent->stats().downloaded, 0u);
}

TEST_F(AgentTest, RunDrainsQueueAndStopsWhenClosed) {
    client.chunks = {"data"};
    auto agent = make();

    agent->queue().push(directDocument(999, "ignored.txt", "data", 1));
    agent->queue().push(directDocument(kAllowed, "first.txt", "data", 2));
    agent->queue().push(directDocument(kAllowed, "second.txt", "data", 3));
    agent->queue().close();

    agent->run(std::chrono::milliseconds(10));

    EXPECT_EQ(agent->stats().updates, 3u);
    EXPECT_EQ(agent->stats().ignored, 1u);
    EXPECT_EQ(agent->stats().downloaded, 2u);
    EXPECT_EQ(read_file(dir / "second.txt"), "data");
}

TEST_F(AgentTest, RunContinuesAfterFailedDownload) {
    client.chunks = {"data"};
    client.beforeChunk = [&](std::size_t) {
        // Only the first download hits the transport error
        if (client.streamed.size() == 1) {
            client.streamError = Error{ErrorCode::NetworkError, "reset"};
        } else {
            client.streamError.reset();
        }
    };
    auto agent = make();

    agent->queue().push(directDocument(kAllowed, "one.txt", "data", 1));
    agent->queue().push(directDocument(kAllowed, "two.txt", "data", 2));
    agent->queue().close();
    agent->run(std::chrono::milliseconds(10));

    EXPECT_EQ(agent->stats().failed, 1u);
    EXPECT_EQ(agent->stats().downloaded, 1u);
    EXPECT_EQ(read_file(dir / "two.txt"), "data");
}

TEST_F(AgentTest, RunEndsWhenTransportClosesStream) {
    client.chunks = {"data"};
    auto agent = make();
    ASSERT_TRUE(agent->start());
    ASSERT_NE(client.subscribed, nullptr);

    // The transport closes the stream on its own thread once its session ends
    std::thread transport([&] {
        client.subscribed->push(directDocument(kAllowed, "last.txt", "data"));
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        client.subscribed->close();
    });
    agent->run(std::chrono::milliseconds(10));
    transport.join();

    EXPECT_FALSE(agent->stopRequested());
    EXPECT_EQ(agent->stats().downloaded, 1u);
    EXPECT_EQ(read_file(dir / "last.txt"), "data");
}

TEST_F(AgentTest, StopRequestEndsRunAndCancels) {
    auto agent = make();
    auto cancel = agent->cancellation();
    EXPECT_FALSE(cancel());

    agent->requestStop();
    EXPECT_TRUE(agent->stopRequested());
    EXPECT_TRUE(cancel());

    agent->queue().push(directDocument(kAllowed, "late.txt", "x"));
    agent->run(std::chrono::milliseconds(10));
    EXPECT_EQ(agent->stats().updates, 0u);
}
