#include <gtest/gtest.h>

#include "parcel/core/time.hpp"

using parcel::core::Timestamp;

TEST(CoreTime, FormatsUtc) {
    EXPECT_EQ(parcel::core::format_iso8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(parcel::core::format_iso8601(1700000000), "2023-11-14T22:13:20Z");
}

TEST(CoreTime, ParsesWhatItFormats) {
    Timestamp t = 0;
    ASSERT_TRUE(parcel::core::parse_iso8601("2023-11-14T22:13:20Z", &t));
    EXPECT_EQ(t, 1700000000);
}

TEST(CoreTime, AcceptsFractionAndMissingZone) {
    Timestamp t = 0;
    ASSERT_TRUE(parcel::core::parse_iso8601("2023-11-14T22:13:20.123456", &t));
    EXPECT_EQ(t, 1700000000);
    ASSERT_TRUE(parcel::core::parse_iso8601("2023-11-14 22:13:20", &t));
    EXPECT_EQ(t, 1700000000);
}

TEST(CoreTime, RejectsMalformed) {
    Timestamp t = 0;
    EXPECT_FALSE(parcel::core::parse_iso8601("", &t));
    EXPECT_FALSE(parcel::core::parse_iso8601("2023-11-14", &t));
    EXPECT_FALSE(parcel::core::parse_iso8601("2023-13-14T22:13:20Z", &t));
    EXPECT_FALSE(parcel::core::parse_iso8601("2023-11-14T22:13:20.Z", &t));
    EXPECT_FALSE(parcel::core::parse_iso8601("2023-11-14T22:13:20+01:00", &t));
    EXPECT_FALSE(parcel::core::parse_iso8601("2023-11-14T22:13:20Z", nullptr));
}

TEST(CoreTime, NowIsAfterBuild) {
    EXPECT_GT(parcel::core::now_utc(), 1700000000);
}
