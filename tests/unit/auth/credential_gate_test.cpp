#include <gtest/gtest.h>

#include <docdrop/auth/credential_gate.h>
#include <docdrop/auth/file_authenticator.h>
#include <docdrop/config/agent_config.h>

#include "../../common/fakes.h"
#include "../../common/test_helpers.h"

#include <filesystem>
#include <memory>
#include <string>

#include <unistd.h>

using namespace docdrop;
using namespace docdrop::auth;
using docdrop::tests::ManualClock;
using docdrop::tests::TempDir;
using docdrop::tests::write_file;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

namespace fs = std::filesystem;

class CredentialGateTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
};

TEST_F(CredentialGateTest, ReturnsTrimmedContentAndDeletesFile) {
    const auto path = write_file(dir / "code.txt", "  12345\n");
    CredentialGate gate(path, minutes(5), clock);

    auto secret = gate.await();
    ASSERT_TRUE(secret) << secret.error().message;
    EXPECT_EQ(secret.value(), "12345");
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(clock->sleeps, 0u);
}

TEST_F(CredentialGateTest, WaitsForFileToAppear) {
    const auto path = dir / "code.txt";
    clock->onSleep = [&](auto slept) {
        if (slept >= seconds(10) && !fs::exists(path)) {
            write_file(path, "67890");
        }
    };
    CredentialGate gate(path, minutes(5), clock);

    auto secret = gate.await();
    ASSERT_TRUE(secret);
    EXPECT_EQ(secret.value(), "67890");
    EXPECT_EQ(clock->sleeps, 20u); // 500 ms polls
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CredentialGateTest, EmptyFileMeansNotReady) {
    const auto path = write_file(dir / "password.txt", " \n\t");
    clock->onSleep = [&](auto slept) {
        if (slept >= seconds(3)) {
            write_file(path, "hunter2\n");
        }
    };
    CredentialGate gate(path, minutes(5), clock);

    auto secret = gate.await();
    ASSERT_TRUE(secret);
    EXPECT_EQ(secret.value(), "hunter2");
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CredentialGateTest, TimesOutWhenNothingArrives) {
    const auto path = dir / "never.txt";
    CredentialGate gate(path, minutes(5), clock);

    auto secret = gate.await();
    ASSERT_FALSE(secret);
    EXPECT_EQ(secret.error().code, ErrorCode::Timeout);
    EXPECT_NE(secret.error().message.find("never.txt"), std::string::npos);
    EXPECT_EQ(clock->sleeps, 600u);
}

TEST_F(CredentialGateTest, HonoursCancellation) {
    int polls = 0;
    clock->onSleep = [&](auto) { ++polls; };
    CredentialGate gate(dir / "code.txt", minutes(5), clock);

    auto secret = gate.await([&] { return polls >= 3; });
    ASSERT_FALSE(secret);
    EXPECT_EQ(secret.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(polls, 3);
}

TEST_F(CredentialGateTest, DirectoryAtPathIsAnError) {
    fs::create_directories(dir / "code.txt");
    CredentialGate gate(dir / "code.txt", minutes(5), clock);
    auto secret = gate.await();
    ASSERT_FALSE(secret);
    EXPECT_EQ(secret.error().code, ErrorCode::IoError);
}

TEST_F(CredentialGateTest, WithholdsSecretWhenDeleteFails) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }
    const auto locked = dir / "locked";
    const auto path = write_file(locked / "code.txt", "12345");
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec);

    CredentialGate gate(path, minutes(5), clock);
    auto secret = gate.await();

    fs::permissions(locked, fs::perms::owner_all);
    ASSERT_FALSE(secret);
    EXPECT_EQ(secret.error().code, ErrorCode::IoError);
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(CredentialGateTest, WithholdsSecretFromUndeletableFile) {
    // procfs entries read as non-empty regular files but refuse unlink, even for root
    const fs::path undeletable{"/proc/self/comm"};
    if (!fs::is_regular_file(undeletable)) {
        GTEST_SKIP() << "procfs not mounted";
    }
    CredentialGate gate(undeletable, minutes(5), clock);
    auto secret = gate.await();
    ASSERT_FALSE(secret);
    EXPECT_EQ(secret.error().code, ErrorCode::IoError);
    EXPECT_NE(secret.error().message.find("could not delete"), std::string::npos);
    EXPECT_EQ(clock->sleeps, 0u);
}

// =============================================================================
// FileAuthenticator
// =============================================================================

TEST_F(CredentialGateTest, AuthenticatorReadsCodeAndPasswordFromTheirFiles) {
    config::AgentConfig cfg;
    cfg.phone = "+15550100";
    cfg.codeFile = write_file(dir / "telegram_code.txt", "24680\n");
    cfg.passwordFile = dir / "telegram_password.txt";
    cfg.secretTimeout = seconds(30);

    FileAuthenticator auth(cfg, clock);
    EXPECT_EQ(auth.phoneNumber(), "+15550100");

    auto code = auth.code({});
    ASSERT_TRUE(code);
    EXPECT_EQ(code.value(), "24680");
    EXPECT_FALSE(fs::exists(cfg.codeFile));

    // Password file is only looked at when asked for
    write_file(cfg.passwordFile, "s3cret");
    auto password = auth.password({});
    ASSERT_TRUE(password);
    EXPECT_EQ(password.value(), "s3cret");
    EXPECT_FALSE(fs::exists(cfg.passwordFile));
}

TEST_F(CredentialGateTest, AuthenticatorPropagatesTimeout) {
    config::AgentConfig cfg;
    cfg.codeFile = dir / "absent.txt";
    cfg.secretTimeout = seconds(2);

    FileAuthenticator auth(cfg, clock);
    auto code = auth.code({});
    ASSERT_FALSE(code);
    EXPECT_EQ(code.error().code, ErrorCode::Timeout);
    EXPECT_EQ(clock->sleeps, 4u);
}
