#include <limits>

#include "gtest/gtest.h"
#include "buffer_range_writer.hpp"
#include "error_code.hpp"
#include "memory_channel.hpp"

using rangeio::buffer_range_writer;

class BufferRangeWriterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            buffer = std::make_shared<std::vector<char> const>(source.begin(), source.end());
        }

        std::string range(buffer_range_writer &writer, std::int64_t offset, std::int64_t length) {
            string_sink sink;
            writer.write_to(sink, offset, length);
            return sink.str;
        }

        void expect_error(buffer_range_writer &writer, std::int64_t offset, std::int64_t length,
            rangeio::errors::error_code_enum expected) {
            string_sink sink;
            try {
                writer.write_to(sink, offset, length);
                FAIL() << "expected error for " << offset << "+" << length;
            } catch (boost::system::system_error const &e) {
                EXPECT_EQ(expected, e.code()) << offset << "+" << length;
            }
            EXPECT_TRUE(sink.str.empty());
        }

        std::string source = test_source;
        std::shared_ptr<std::vector<char> const> buffer;
};

TEST_F(BufferRangeWriterTest, WritesRange) {
    buffer_range_writer writer(buffer);
    EXPECT_EQ(source.substr(10, 50), range(writer, 10, 50));
}

TEST_F(BufferRangeWriterTest, DecreasingOffsets) {
    buffer_range_writer writer(buffer);
    EXPECT_EQ(source.substr(55, 10), range(writer, 55, 10));
    EXPECT_EQ(source.substr(35, 10), range(writer, 35, 10));
    EXPECT_EQ(source.substr(10, 20), range(writer, 10, 20));
}

TEST_F(BufferRangeWriterTest, WholeAndEmptyRanges) {
    buffer_range_writer writer(buffer);
    EXPECT_EQ(source, range(writer, 0, 83));
    EXPECT_EQ("", range(writer, 83, 0));
    EXPECT_EQ("", range(writer, 0, 0));
}

TEST_F(BufferRangeWriterTest, OutOfBounds) {
    buffer_range_writer writer(buffer);
    expect_error(writer, 80, 10, rangeio::errors::range_out_of_bounds);
    expect_error(writer, 84, 0, rangeio::errors::range_out_of_bounds);
    expect_error(writer, 0, 84, rangeio::errors::range_out_of_bounds);
    expect_error(writer, 1, std::numeric_limits<std::int64_t>::max(), rangeio::errors::range_out_of_bounds);
}

TEST_F(BufferRangeWriterTest, NegativeRange) {
    buffer_range_writer writer(buffer);
    expect_error(writer, -1, 10, rangeio::errors::invalid_range);
    expect_error(writer, 10, -1, rangeio::errors::invalid_range);
}

TEST_F(BufferRangeWriterTest, CloseIsNoop) {
    buffer_range_writer writer(buffer);
    writer.close();
    EXPECT_EQ(2, buffer.use_count());
}
