#include <gtest/gtest.h>

#include "harbor/storage/byte_range.h"

using harbor::storage::ByteRange;
using harbor::storage::ParseRangeHeader;

TEST(ByteRange, EmptyHeaderIsFull) {
    auto range = ParseRangeHeader("");
    ASSERT_TRUE(range.ok());
    EXPECT_TRUE(range.value().IsFull());
}

TEST(ByteRange, ParsesStartOffset) {
    auto range = ParseRangeHeader("bytes=5-");
    ASSERT_TRUE(range.ok());
    EXPECT_EQ(range.value().kind, ByteRange::Kind::kStartOffset);
    EXPECT_EQ(range.value().start, 5u);
}

TEST(ByteRange, ParsesInclusiveRange) {
    auto range = ParseRangeHeader("bytes=5-10");
    ASSERT_TRUE(range.ok());
    EXPECT_EQ(range.value().kind, ByteRange::Kind::kInclusiveRange);
    EXPECT_EQ(range.value().start, 5u);
    EXPECT_EQ(range.value().end, 10u);
}

TEST(ByteRange, ParsesSuffixLength) {
    auto range = ParseRangeHeader("bytes=-7");
    ASSERT_TRUE(range.ok());
    EXPECT_EQ(range.value().kind, ByteRange::Kind::kSuffixLength);
    EXPECT_EQ(range.value().suffix_length, 7u);
}

TEST(ByteRange, HonorsOnlyTheFirstRange) {
    auto range = ParseRangeHeader("bytes=0-1, 4-6, -2");
    ASSERT_TRUE(range.ok());
    EXPECT_EQ(range.value().kind, ByteRange::Kind::kInclusiveRange);
    EXPECT_EQ(range.value().start, 0u);
    EXPECT_EQ(range.value().end, 1u);
}

TEST(ByteRange, RejectsMalformedValues) {
    for (const char* value : {"items=0-1", "bytes=", "bytes=abc", "bytes=1-a", "bytes=-0",
                              "bytes=9-3", "0-1", "bytes=99999999999999999999-"}) {
        auto range = ParseRangeHeader(value);
        ASSERT_FALSE(range.ok()) << value;
        EXPECT_EQ(range.error().code, harbor::core::ErrorCode::kInvalidArgument) << value;
    }
}
