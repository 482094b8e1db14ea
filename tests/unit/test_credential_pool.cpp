#include <gtest/gtest.h>
#include "llm/credential_pool.h"
#include "llm/llm_provider.h"
#include "test_helpers.h"

namespace {

CredentialPool::Clock::time_point g_now{};

CredentialPool::Clock::time_point fake_now() {
    return g_now;
}

} // namespace

class CredentialPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_now = CredentialPool::Clock::time_point(std::chrono::hours(1000));
        pool = std::make_unique<CredentialPool>(
            "gemini",
            std::vector<std::pair<std::string, std::string>>{{"key_1", "s1"}, {"key_2", "s2"}, {"key_3", "s3"}},
            std::chrono::seconds(300));
        pool->set_clock(&fake_now);
    }

    std::unique_ptr<CredentialPool> pool;
};

TEST_F(CredentialPoolTest, RoundRobin) {
    EXPECT_EQ(pool->current().id, "key_1");
    EXPECT_EQ(pool->current().id, "key_2");
    EXPECT_EQ(pool->current().id, "key_3");
    EXPECT_EQ(pool->current().id, "key_1");
}

TEST_F(CredentialPoolTest, RateLimitedKeyIsSkippedDuringCooldown) {
    pool->report("key_2", false, "HTTP 429: Too Many Requests");
    EXPECT_EQ(pool->available_count(), 2u);

    for (int i = 0; i < 6; i++) {
        EXPECT_NE(pool->current().id, "key_2");
    }

    g_now += std::chrono::seconds(301);
    EXPECT_EQ(pool->available_count(), 3u);
}

TEST_F(CredentialPoolTest, OtherErrorsDoNotCoolDown) {
    pool->report("key_1", false, "HTTP 500: backend error");
    EXPECT_EQ(pool->available_count(), 3u);
    EXPECT_EQ(pool->stats()["key_details"]["key_1"]["consecutive_failures"], 1);
}

TEST_F(CredentialPoolTest, AllCoolingUsesEarliestRecovery) {
    pool->report("key_1", false, "rate limit");
    g_now += std::chrono::seconds(10);
    pool->report("key_2", false, "rate limit");
    g_now += std::chrono::seconds(10);
    pool->report("key_3", false, "rate limit");

    EXPECT_EQ(pool->available_count(), 0u);
    EXPECT_EQ(pool->current().id, "key_1");
}

TEST_F(CredentialPoolTest, SuccessResetsFailures) {
    pool->report("key_1", false, "timeout");
    pool->report("key_1", false, "timeout");
    pool->report("key_1", true);

    auto details = pool->stats()["key_details"]["key_1"];
    EXPECT_EQ(details["consecutive_failures"], 0);
    EXPECT_EQ(details["total_requests"], 3);
    EXPECT_EQ(details["successful_requests"], 1);
}

TEST_F(CredentialPoolTest, ResetClearsCooldown) {
    pool->report("key_1", false, "quota exceeded");
    pool->report("key_2", false, "quota exceeded");

    pool->reset("key_1");
    EXPECT_EQ(pool->available_count(), 2u);
    pool->reset();
    EXPECT_EQ(pool->available_count(), 3u);
}

TEST_F(CredentialPoolTest, UnknownIdIgnored) {
    EXPECT_NO_THROW(pool->report("key_9", false, "rate limit"));
    EXPECT_EQ(pool->available_count(), 3u);
}

TEST(CredentialPoolEnvTest, NumberedKeysWin) {
    test_helpers::ScopedEnv k1("DIRGENTEST_API_KEY_1", "first");
    test_helpers::ScopedEnv k2("DIRGENTEST_API_KEY_2", "...placeholder");
    test_helpers::ScopedEnv k3("DIRGENTEST_API_KEY_3", "third");
    test_helpers::ScopedEnv single("DIRGENTEST_API_KEY", "single");

    auto pool = CredentialPool::from_environment("test", "DIRGENTEST", std::chrono::seconds(60));
    EXPECT_EQ(pool->size(), 2u);
    EXPECT_EQ(pool->current().secret, "first");
    EXPECT_EQ(pool->current().secret, "third");
}

TEST(CredentialPoolEnvTest, SingleKeyFallback) {
    test_helpers::ScopedEnv single("DIRGENSOLO_API_KEY", "only");
    auto pool = CredentialPool::from_environment("solo", "DIRGENSOLO", std::chrono::seconds(60));
    EXPECT_EQ(pool->size(), 1u);
    EXPECT_EQ(pool->current().id, "key_single");
}

TEST(CredentialPoolEnvTest, NoKeys) {
    EXPECT_THROW(CredentialPool::from_environment("none", "DIRGEN_NO_SUCH", std::chrono::seconds(60)),
                 ProviderError);
}
