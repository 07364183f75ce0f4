#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include <boost/system/system_error.hpp>

#include "gtest/gtest.h"
#include "memory_channel.hpp"
#include "rangecat.hpp"
#include "writer.hpp"

class RangecatTest : public ::testing::Test {
    protected:
        void SetUp() override {
            file.reset(new temp_file(source));
            cfg.file = file->path();
            cfg.content_type = "text/plain";
            ASSERT_EQ(0, pipe(fds));
        }

        void TearDown() override {
            close(fds[0]);
            close(fds[1]);
        }

        std::string read_pipe(std::size_t count) {
            std::string ret(count, '\0');
            std::size_t done = 0;
            while (done < count) {
                ssize_t n = read(fds[0], &ret[done], count - done);
                if (n <= 0) {
                    break;
                }
                done += n;
            }
            ret.resize(done);
            return ret;
        }

        std::string source = test_source;
        std::unique_ptr<temp_file> file;
        rangeio::config cfg;
        int fds[2];
};

// throws something other than a system_error
class throwing_sink : public rangeio::byte_sink {
    public:
        void write(char const *, std::size_t) override
        {
            throw std::runtime_error("sink gone");
        }
};

TEST_F(RangecatTest, FdSinkWritesThroughPipe) {
    rangeio::fd_sink sink(fds[1]);
    sink.write(source.data(), 10);
    sink.write(source.data() + 10, source.size() - 10);

    EXPECT_EQ(source, read_pipe(source.size()));
}

TEST_F(RangecatTest, FdSinkReportsErrno) {
    rangeio::fd_sink sink(fds[0]);
    try {
        sink.write("x", 1);
        FAIL() << "expected write error";
    } catch (boost::system::system_error const &e) {
        EXPECT_EQ(EBADF, e.code().value());
        EXPECT_TRUE(e.code().category() == boost::system::system_category());
    }
}

TEST_F(RangecatTest, ServesRangeToFd) {
    cfg.ranges = {"bytes=10-59"};
    cfg.print_headers = true;
    rangeio::fd_sink body(fds[1]);
    std::ostringstream headers;

    EXPECT_EQ(0, rangeio::serve_file(cfg, body, headers));
    EXPECT_EQ(source.substr(10, 50), read_pipe(50));
    EXPECT_EQ(0u, headers.str().find("HTTP/1.1 206\r\n"));
    EXPECT_NE(std::string::npos, headers.str().find("Content-Range: bytes 10-59/83\r\n"));
}

TEST_F(RangecatTest, HeadersOnlyWhenAsked) {
    string_sink body;
    std::ostringstream headers;

    EXPECT_EQ(0, rangeio::serve_file(cfg, body, headers));
    EXPECT_EQ(source, body.str);
    EXPECT_TRUE(headers.str().empty());
}

TEST_F(RangecatTest, UnsatisfiableExitsOne) {
    cfg.ranges = {"bytes=200-"};
    string_sink body;
    std::ostringstream headers;

    EXPECT_EQ(1, rangeio::serve_file(cfg, body, headers));
    EXPECT_TRUE(body.str.empty());
}

TEST_F(RangecatTest, MissingFileExitsOne) {
    cfg.file = "/nonexistent/rangeio/file";
    string_sink body;
    std::ostringstream headers;

    EXPECT_EQ(1, rangeio::serve_file(cfg, body, headers));
}

TEST_F(RangecatTest, SinkFailureExitsOne) {
    std::ostringstream headers;

    failing_sink broken;
    EXPECT_EQ(1, rangeio::serve_file(cfg, broken, headers));

    throwing_sink throwing;
    EXPECT_EQ(1, rangeio::serve_file(cfg, throwing, headers));
}
