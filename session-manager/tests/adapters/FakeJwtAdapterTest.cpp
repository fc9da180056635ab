#include <gtest/gtest.h>

#include "adapters/secondary/auth/FakeJwtAdapter.hpp"

using namespace sandbox;

class FakeJwtAdapterTest : public ::testing::Test {
protected:
    adapters::secondary::FakeJwtAdapter tokens_;
};

TEST_F(FakeJwtAdapterTest, IssueAndVerify) {
    auto token = tokens_.issue("researcher_a1b2c3d4", "sess-1", std::chrono::hours(2));

    EXPECT_EQ(token.rfind("eyJ.", 0), 0u);
    auto claims = tokens_.verify(token);
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ(claims->subject, "researcher_a1b2c3d4");
    EXPECT_EQ(claims->sessionId, "sess-1");
    EXPECT_GT(claims->expiresAt.toUnixSeconds(), domain::Timestamp::now().toUnixSeconds() + 7000);
}

TEST_F(FakeJwtAdapterTest, ExpiredTokenIsRejected) {
    auto token = tokens_.issue("researcher_a1b2c3d4", "sess-1", std::chrono::seconds(0));

    EXPECT_FALSE(tokens_.verify(token).has_value());
}

TEST_F(FakeJwtAdapterTest, RevokedTokenIsRejected) {
    auto token = tokens_.issue("researcher_a1b2c3d4", "sess-1", std::chrono::hours(1));
    auto other = tokens_.issue("researcher_a1b2c3d4", "sess-2", std::chrono::hours(1));

    tokens_.revoke(token);

    EXPECT_FALSE(tokens_.verify(token).has_value());
    EXPECT_TRUE(tokens_.verify(other).has_value());
}

TEST_F(FakeJwtAdapterTest, MalformedTokens) {
    EXPECT_FALSE(tokens_.verify("").has_value());
    EXPECT_FALSE(tokens_.verify("no-dots-at-all").has_value());
    EXPECT_FALSE(tokens_.verify("eyJ.bm90IGpzb24.sig").has_value());
}
