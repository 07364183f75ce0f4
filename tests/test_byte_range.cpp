#include "gtest/gtest.h"
#include "byte_range.hpp"

using rangeio::inclusive_byte_range;

namespace {

std::vector<inclusive_byte_range> parse(std::string const &header, std::int64_t size = 100) {
    return inclusive_byte_range::satisfiable_ranges({header}, size);
}

}

TEST(ByteRangeTest, Simple) {
    auto ranges = parse("bytes=0-9");
    ASSERT_EQ(1u, ranges.size());
    EXPECT_EQ(0, ranges[0].first());
    EXPECT_EQ(9, ranges[0].last());
    EXPECT_EQ(10, ranges[0].size());
}

TEST(ByteRangeTest, OpenEnded) {
    auto ranges = parse("bytes=90-");
    ASSERT_EQ(1u, ranges.size());
    EXPECT_EQ(inclusive_byte_range(90, 99), ranges[0]);
}

TEST(ByteRangeTest, Suffix) {
    EXPECT_EQ(std::vector<inclusive_byte_range>({{90, 99}}), parse("bytes=-10"));
    // longer than the resource
    EXPECT_EQ(std::vector<inclusive_byte_range>({{0, 99}}), parse("bytes=-500"));
    EXPECT_TRUE(parse("bytes=-0").empty());
}

TEST(ByteRangeTest, LastClampedToEnd) {
    EXPECT_EQ(std::vector<inclusive_byte_range>({{95, 99}}), parse("bytes=95-200"));
}

TEST(ByteRangeTest, Unsatisfiable) {
    EXPECT_TRUE(parse("bytes=100-").empty());
    EXPECT_TRUE(parse("bytes=100-150").empty());
    EXPECT_EQ(std::vector<inclusive_byte_range>({{0, 4}}), parse("bytes=0-4,200-300"));
}

TEST(ByteRangeTest, MultipleRanges) {
    EXPECT_EQ(std::vector<inclusive_byte_range>({{0, 9}, {20, 29}}), parse("bytes=0-9,20-29"));
    EXPECT_EQ(std::vector<inclusive_byte_range>({{50, 59}, {0, 9}}), parse("bytes=50-59, 0-9"));
}

TEST(ByteRangeTest, Whitespace) {
    EXPECT_EQ(std::vector<inclusive_byte_range>({{0, 4}, {10, 14}}), parse("bytes= 0 - 4 , 10-14 "));
}

TEST(ByteRangeTest, OverlappingRangesCoalesce) {
    EXPECT_EQ(std::vector<inclusive_byte_range>({{0, 15}}), parse("bytes=0-10,5-15"));
    EXPECT_EQ(std::vector<inclusive_byte_range>({{0, 14}}), parse("bytes=0-4,10-14,3-12"));
    EXPECT_EQ(std::vector<inclusive_byte_range>({{10, 30}}), parse("bytes=20-25,10-30"));
}

TEST(ByteRangeTest, AdjacentRangesStaySeparate) {
    EXPECT_EQ(std::vector<inclusive_byte_range>({{0, 4}, {5, 9}}), parse("bytes=0-4,5-9"));
}

TEST(ByteRangeTest, SeveralHeaders) {
    auto ranges = inclusive_byte_range::satisfiable_ranges({"bytes=0-4", "bytes=10-14"}, 100);
    EXPECT_EQ(std::vector<inclusive_byte_range>({{0, 4}, {10, 14}}), ranges);
}

TEST(ByteRangeTest, Malformed) {
    EXPECT_TRUE(parse("bytes=abc").empty());
    EXPECT_TRUE(parse("bytes=1-2-3").empty());
    EXPECT_TRUE(parse("bytes=5-2").empty());
    EXPECT_TRUE(parse("bytes=-").empty());
    EXPECT_TRUE(parse("items=0-4").empty());
    // a bad range drops what came before it
    EXPECT_TRUE(parse("bytes=0-4,x-5").empty());
    EXPECT_EQ(std::vector<inclusive_byte_range>({{10, 14}}), parse("bytes=x-5,10-14"));
}

TEST(ByteRangeTest, EmptyHeader) {
    EXPECT_TRUE(parse("").empty());
    EXPECT_TRUE(inclusive_byte_range::satisfiable_ranges({}, 100).empty());
}

TEST(ByteRangeTest, HeaderStrings) {
    EXPECT_EQ("bytes 0-9/100", inclusive_byte_range(0, 9).to_header_range_string(100));
    EXPECT_EQ("bytes */100", inclusive_byte_range::to_416_header_range_string(100));
}
