#include "auth_token_manager.hpp"
#include "errors.hpp"

#include "fakes.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <thread>

namespace rplayer {
namespace {

using test::FakeHttpClient;
using test::ManualClock;

constexpr const char* AUTH1 = "https://auth.test/auth1";
constexpr const char* AUTH2 = "https://auth.test/auth2";

class AuthTokenManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.authkey = "0123456789abcdef";
        config_.auth1_urls = {AUTH1};
        config_.auth2_urls = {AUTH2};
        config_.token_ttl = std::chrono::seconds(4200);
        config_.safety_margin = std::chrono::seconds(60);
        config_.max_attempts = 3;
        config_.backoff = std::chrono::milliseconds(500);
    }

    void script_handshake(const std::string& token = "tok-1") {
        http_.respond(AUTH1, 200, "", {{"X-Radiko-AuthToken", token},
                                       {"X-Radiko-KeyLength", "4"},
                                       {"X-Radiko-KeyOffset", "2"}});
        http_.respond(AUTH2, 200, "JP13,\xE6\x9D\xB1\xE4\xBA\xAC\xE9\x83\xBD,tokyo Japan\r\n");
    }

    static bool wait_for_handshakes(const AuthTokenManager& auth, int count) {
        for (int i = 0; i < 250; ++i) {
            if (auth.handshakeCount() >= count) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }

    std::unique_ptr<AuthTokenManager> make() {
        return std::make_unique<AuthTokenManager>(http_, config_, clock_.fn(),
                                                  [this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
    }

    FakeHttpClient http_;
    ManualClock clock_;
    AuthConfig config_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(AuthTokenManagerTest, HandshakeProducesToken) {
    script_handshake();
    auto auth = make();
    AuthToken token = auth->getValidToken();
    EXPECT_EQ(token.value, "tok-1");
    // Four bytes of the key starting at offset two
    EXPECT_EQ(token.partial_key, "MjM0NQ==");
    EXPECT_EQ(token.area_id, "JP13");
    EXPECT_EQ(token.validity, std::chrono::seconds(4200));
    EXPECT_EQ(auth->handshakeCount(), 1);
}

TEST_F(AuthTokenManagerTest, ConfirmationCarriesChallengeAnswer) {
    script_handshake();
    auto auth = make();
    auth->getValidToken();

    bool found = false;
    for (const auto& request : http_.requests()) {
        if (request.url != AUTH2) continue;
        found = true;
        EXPECT_EQ(request.method, "POST");
        EXPECT_NE(std::find(request.headers.begin(), request.headers.end(),
                            std::make_pair(std::string("X-Radiko-Partialkey"), std::string("MjM0NQ=="))),
                  request.headers.end());
        EXPECT_NE(std::find(request.headers.begin(), request.headers.end(),
                            std::make_pair(std::string("X-Radiko-AuthToken"), std::string("tok-1"))),
                  request.headers.end());
    }
    EXPECT_TRUE(found);
}

TEST_F(AuthTokenManagerTest, CachedUntilSafetyMargin) {
    script_handshake();
    auto auth = make();
    auth->getValidToken();

    clock_.advance(std::chrono::seconds(4139));
    auth->getValidToken();
    EXPECT_EQ(auth->handshakeCount(), 1);

    clock_.advance(std::chrono::seconds(1));
    AuthToken renewed = auth->getValidToken();
    EXPECT_EQ(auth->handshakeCount(), 2);
    EXPECT_EQ(renewed.generation, 2u);
}

TEST_F(AuthTokenManagerTest, GivesUpAfterMaxAttempts) {
    auto auth = make();
    EXPECT_THROW(auth->getValidToken(), AuthUnavailable);
    EXPECT_EQ(auth->handshakeCount(), 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 500);
    EXPECT_EQ(sleeps_[1].count(), 1000);
    EXPECT_FALSE(auth->cached().has_value());
}

TEST_F(AuthTokenManagerTest, RecoversAfterTransientFailure) {
    auto auth = make();
    EXPECT_THROW(auth->getValidToken(), AuthUnavailable);
    script_handshake();
    EXPECT_EQ(auth->getValidToken().value, "tok-1");
}

TEST_F(AuthTokenManagerTest, ChallengeOutsideKeyIsRejected) {
    http_.respond(AUTH1, 200, "", {{"X-Radiko-AuthToken", "tok"},
                                   {"X-Radiko-KeyLength", "16"},
                                   {"X-Radiko-KeyOffset", "8"}});
    http_.respond(AUTH2, 200, "JP13");
    auto auth = make();
    EXPECT_THROW(auth->getValidToken(), AuthUnavailable);
    EXPECT_EQ(http_.count(AUTH2), 0u);
}

TEST_F(AuthTokenManagerTest, RejectedConfirmationFails) {
    script_handshake();
    http_.respond(AUTH2, 401, "");
    auto auth = make();
    EXPECT_THROW(auth->getValidToken(), AuthUnavailable);
}

TEST_F(AuthTokenManagerTest, ConcurrentCallersShareOneHandshake) {
    script_handshake();
    http_.set_delay(std::chrono::milliseconds(50));
    auto auth = make();

    std::vector<std::thread> callers;
    std::vector<std::string> values(4);
    for (size_t i = 0; i < values.size(); ++i) {
        callers.emplace_back([&, i] { values[i] = auth->getValidToken().value; });
    }
    for (auto& caller : callers) caller.join();

    EXPECT_EQ(auth->handshakeCount(), 1);
    for (const auto& value : values) {
        EXPECT_EQ(value, "tok-1");
    }
}

TEST_F(AuthTokenManagerTest, InvalidateForcesRenewal) {
    script_handshake();
    auto auth = make();
    AuthToken first = auth->getValidToken();
    auth->invalidate("someone-else");
    EXPECT_TRUE(auth->cached().has_value());
    auth->invalidate(first.value);
    EXPECT_FALSE(auth->cached().has_value());
    auth->getValidToken();
    EXPECT_EQ(auth->handshakeCount(), 2);
}

TEST_F(AuthTokenManagerTest, SuppliedTokenSkipsHandshake) {
    config_.token_override = "external";
    auto auth = make();
    clock_.advance(std::chrono::hours(24 * 30));
    EXPECT_EQ(auth->getValidToken().value, "external");
    auth->invalidate("external");
    EXPECT_EQ(auth->getValidToken().value, "external");
    EXPECT_EQ(http_.total(), 0u);
}

TEST_F(AuthTokenManagerTest, StreamHeaders) {
    script_handshake();
    auto auth = make();
    HeaderList headers = auth->streamHeaders(auth->getValidToken());
    auto has = [&](const std::string& key, const std::string& value) {
        return std::find(headers.begin(), headers.end(), std::make_pair(key, value)) != headers.end();
    };
    EXPECT_TRUE(has("X-Radiko-AuthToken", "tok-1"));
    EXPECT_TRUE(has("X-Radiko-Partialkey", "MjM0NQ=="));
    EXPECT_TRUE(has("X-Radiko-AreaId", "JP13"));
}

TEST_F(AuthTokenManagerTest, BackgroundRenewalLeavesFreshTokenAlone) {
    script_handshake();
    auto auth = make();
    auth->getValidToken();

    auth->startBackgroundRenewal();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auth->stop();
    EXPECT_EQ(auth->handshakeCount(), 1);
}

TEST_F(AuthTokenManagerTest, BackgroundRenewalRenewsInsideMargin) {
    script_handshake();
    auto auth = make();
    auth->getValidToken();
    script_handshake("tok-2");
    clock_.advance(std::chrono::seconds(4150));

    auth->startBackgroundRenewal();
    ASSERT_TRUE(wait_for_handshakes(*auth, 2));
    // The renewed token is fresh again, so the thread goes back to waiting
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auth->stop();

    EXPECT_EQ(auth->handshakeCount(), 2);
    ASSERT_TRUE(auth->cached().has_value());
    EXPECT_EQ(auth->cached()->value, "tok-2");
    EXPECT_EQ(auth->cached()->generation, 2u);
}

TEST_F(AuthTokenManagerTest, FailedBackgroundRenewalBacksOffAndStops) {
    script_handshake();
    auto auth = make();
    auth->getValidToken();
    http_.forget(AUTH1);
    clock_.advance(std::chrono::seconds(4150));

    auth->startBackgroundRenewal();
    ASSERT_TRUE(wait_for_handshakes(*auth, 4));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    // One full round of attempts, then a pause rather than another round
    EXPECT_EQ(auth->handshakeCount(), 4);

    auto before = std::chrono::steady_clock::now();
    auth->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(1));

    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 500);
    EXPECT_EQ(sleeps_[1].count(), 1000);
    // The old token stays until it really runs out
    ASSERT_TRUE(auth->cached().has_value());
    EXPECT_EQ(auth->cached()->value, "tok-1");
}

} // namespace
} // namespace rplayer
