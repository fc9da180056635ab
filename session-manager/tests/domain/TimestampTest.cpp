#include <gtest/gtest.h>

#include "domain/Timestamp.hpp"

using namespace sandbox::domain;

TEST(TimestampTest, RoundTripThroughIsoString) {
    auto ts = Timestamp::fromUnixSeconds(1765881000);

    EXPECT_EQ(ts.toString(), "2025-12-16T10:30:00Z");
    EXPECT_EQ(Timestamp::fromString(ts.toString())->toUnixSeconds(), 1765881000);
}

TEST(TimestampTest, FromString_AppliesOffsetAndDropsFraction) {
    auto withOffset = Timestamp::fromString("2025-12-16T13:30:00.123456+03:00");

    ASSERT_TRUE(withOffset.has_value());
    EXPECT_EQ(withOffset->toString(), "2025-12-16T10:30:00Z");
}

TEST(TimestampTest, FromString_RejectsGarbage) {
    EXPECT_FALSE(Timestamp::fromString("yesterday").has_value());
    EXPECT_FALSE(Timestamp::fromString("").has_value());
}

TEST(TimestampTest, FormatRemaining_HoursAndMinutes) {
    EXPECT_EQ(formatRemaining(std::chrono::seconds(5 * 3600 + 59 * 60 + 30)), "5h 59m");
    EXPECT_EQ(formatRemaining(std::chrono::seconds(59)), "0h 0m");
    EXPECT_EQ(formatRemaining(std::chrono::seconds(-10)), "0h 0m");
}
