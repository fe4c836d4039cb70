#include <gtest/gtest.h>
#include "mcphub/transport/stdio_transport.hpp"
#include "mcphub/error.hpp"
#include <unistd.h>
#include <chrono>
#include <string>
#include <thread>

using namespace mcphub;

// A transport reading from one pipe, with the test holding the other ends.
class PipeFixture : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(pipe(in_), 0);
        ASSERT_EQ(pipe(out_), 0);
        transport_ = std::make_unique<StdioTransport>(in_[0], out_[1]);
    }

    void TearDown() override {
        transport_.reset();
        if (in_[1] >= 0) close(in_[1]);
        close(out_[0]);
    }

    void feed(const std::string& data) {
        ASSERT_EQ(write(in_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_input() {
        close(in_[1]);
        in_[1] = -1;
    }

    int in_[2]{-1, -1};
    int out_[2]{-1, -1};
    std::unique_ptr<StdioTransport> transport_;
};

TEST_F(PipeFixture, ReadLineSplitsOnNewline) {
    feed("first\nsecond\n");
    std::string line;
    ASSERT_TRUE(transport_->read_line(line));
    EXPECT_EQ(line, "first");
    ASSERT_TRUE(transport_->read_line(line));
    EXPECT_EQ(line, "second");
}

TEST_F(PipeFixture, ReadLineKeepsCarriageReturn) {
    feed("Content-Length: 2\r\n");
    std::string line;
    ASSERT_TRUE(transport_->read_line(line));
    EXPECT_EQ(line, "Content-Length: 2\r");
}

TEST_F(PipeFixture, UnterminatedLineReturnedBeforeEof) {
    feed("tail");
    close_input();
    std::string line;
    ASSERT_TRUE(transport_->read_line(line));
    EXPECT_EQ(line, "tail");
    EXPECT_FALSE(transport_->read_line(line));
    EXPECT_FALSE(transport_->is_connected());
}

TEST_F(PipeFixture, ReadExactAfterLine) {
    feed("header\nabcdefXYZ");
    std::string line, body;
    ASSERT_TRUE(transport_->read_line(line));
    ASSERT_TRUE(transport_->read_exact(6, body));
    EXPECT_EQ(body, "abcdef");
    ASSERT_TRUE(transport_->read_exact(3, body));
    EXPECT_EQ(body, "XYZ");
}

TEST_F(PipeFixture, ReadExactShortStream) {
    feed("abc");
    close_input();
    std::string body;
    EXPECT_FALSE(transport_->read_exact(10, body));
}

TEST_F(PipeFixture, ReadExactAcrossChunks) {
    std::string big(10000, 'x');
    std::thread writer([&] {
        feed(big.substr(0, 3000));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        feed(big.substr(3000));
    });
    std::string body;
    ASSERT_TRUE(transport_->read_exact(big.size(), body));
    EXPECT_EQ(body, big);
    writer.join();
}

TEST_F(PipeFixture, WriteAll) {
    transport_->write_all("hello");
    char buf[8] = {};
    ASSERT_EQ(read(out_[0], buf, sizeof(buf)), 5);
    EXPECT_EQ(std::string(buf, 5), "hello");
}

TEST_F(PipeFixture, ShutdownWakesBlockedReader) {
    bool result = true;
    std::thread reader([&] {
        std::string line;
        result = transport_->read_line(line);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    transport_->shutdown();
    reader.join();

    EXPECT_FALSE(result);
    EXPECT_FALSE(transport_->is_connected());
}

TEST_F(PipeFixture, ShutdownIsIdempotent) {
    transport_->shutdown();
    EXPECT_NO_THROW(transport_->shutdown());
}

TEST_F(PipeFixture, WriteAfterShutdownThrows) {
    transport_->shutdown();
    EXPECT_THROW(transport_->write_all("x"), McpTransportError);
}

TEST(StdioTransport, WriteToClosedReaderThrows) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    int unused[2];
    ASSERT_EQ(pipe(unused), 0);
    close(fds[0]);
    close(unused[1]);

    StdioTransport t(unused[0], fds[1]);
    EXPECT_THROW(t.write_all("data"), McpTransportError);
    EXPECT_FALSE(t.is_connected());
}
