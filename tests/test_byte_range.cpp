#include <gtest/gtest.h>
#include "byte_range.h"

#include <stdexcept>

namespace {

TEST(ByteRangeTest, ToString) {
    EXPECT_EQ(toString(ByteRange{0, 399}), "0-399");
    EXPECT_EQ(toString(ByteRange{0, 0}), "0-0");
    EXPECT_EQ(toString(ByteRange{4294967296LL, 8589934591LL}), "4294967296-8589934591");
}

TEST(ByteRangeTest, ParseValid) {
    EXPECT_EQ(parseRange("200-1000"), (ByteRange{200, 1000}));
    EXPECT_EQ(parseRange("0-0"), (ByteRange{0, 0}));
    EXPECT_EQ(parseRange("7-7"), (ByteRange{7, 7}));
}

TEST(ByteRangeTest, ParseRejectsMalformed) {
    for (const char* bad : {"", "-", "12", "12-", "-12", "a-b", "1-2-3",
                            " 1-2", "1-2 ", "+1-2", "1--2", "5-4"}) {
        EXPECT_THROW(parseRange(bad), std::invalid_argument) << "input: \"" << bad << "\"";
    }
}

TEST(ByteRangeTest, ParseRejectsOverflow) {
    EXPECT_THROW(parseRange("0-99999999999999999999"), std::invalid_argument);
}

// ── Range Size Calculator ──────────────────────────────────────

TEST(ByteRangeTest, RangeLengthInclusive) {
    EXPECT_EQ(rangeLength("200-1000"), 801);
    EXPECT_EQ(rangeLength("0-399"), 400);
    EXPECT_EQ(rangeLength("5-5"), 1);
}

TEST(ByteRangeTest, RangeLengthSentinelIsZero) {
    EXPECT_EQ(rangeLength("0-0"), 0);
}

TEST(ByteRangeTest, RangeLengthRejectsMalformed) {
    EXPECT_THROW(rangeLength("oops"), std::invalid_argument);
}

// ── Sentinel disambiguation with a known file size ─────────────

TEST(ByteRangeTest, ExpectedSegmentSizeDistinguishesEmptyFromOneByte) {
    ByteRange r{0, 0};
    EXPECT_EQ(expectedSegmentSize(r, 0), 0);
    EXPECT_EQ(expectedSegmentSize(r, 1), 1);
    EXPECT_EQ(expectedSegmentSize(ByteRange{100, 199}, 300), 100);
}

TEST(ByteRangeTest, Ordering) {
    EXPECT_TRUE((ByteRange{0, 9}) < (ByteRange{10, 19}));
    EXPECT_TRUE((ByteRange{0, 9}) < (ByteRange{0, 10}));
    EXPECT_FALSE((ByteRange{10, 19}) < (ByteRange{0, 9}));
    EXPECT_NE((ByteRange{0, 9}), (ByteRange{0, 8}));
}

} // namespace
