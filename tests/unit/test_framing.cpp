#include <gtest/gtest.h>
#include "mcphub/framing.hpp"
#include "mcphub/codec.hpp"
#include "mcphub/error.hpp"
#include <unistd.h>
#include <memory>
#include <string>
#include <vector>

using namespace mcphub;

namespace {

// Reader transport fed from a pipe the test writes into.
struct FeedPipe {
    FeedPipe() {
        int fds[2];
        if (pipe(fds) < 0) throw std::runtime_error("pipe failed");
        write_fd = fds[1];
        int sink[2];
        if (pipe(sink) < 0) throw std::runtime_error("pipe failed");
        close(sink[0]);
        transport = std::make_unique<StdioTransport>(fds[0], sink[1]);
    }

    ~FeedPipe() {
        if (write_fd >= 0) close(write_fd);
    }

    void feed(const std::string& data) {
        if (write(write_fd, data.data(), data.size()) != static_cast<ssize_t>(data.size())) {
            throw std::runtime_error("short write");
        }
    }

    void close_input() {
        close(write_fd);
        write_fd = -1;
    }

    int write_fd{-1};
    std::unique_ptr<StdioTransport> transport;
};

} // anonymous namespace

TEST(FramingEncode, HeaderCountsBytes) {
    auto req = make_request(1, "tools/call", {{"text", "h\xc3\xa9llo"}});
    std::string payload = Codec::serialize(req);
    std::string framed = Framing::encode(req);

    EXPECT_EQ(framed, "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload);
}

TEST(FramingContentLength, Parses) {
    EXPECT_EQ(Framing::parse_content_length("Content-Length: 42"), 42u);
    EXPECT_EQ(Framing::parse_content_length("Content-Length:7\r"), 7u);
    EXPECT_EQ(Framing::parse_content_length("  Content-Length:   13  "), 13u);
}

TEST(FramingContentLength, Rejects) {
    EXPECT_FALSE(Framing::parse_content_length("Content-Type: application/json").has_value());
    EXPECT_FALSE(Framing::parse_content_length("Content-Length:").has_value());
    EXPECT_FALSE(Framing::parse_content_length("Content-Length: abc").has_value());
    EXPECT_FALSE(Framing::parse_content_length("Content-Length: 12x").has_value());
    EXPECT_FALSE(Framing::parse_content_length("Content-Length: -5").has_value());
}

// ---- Round trip ----

TEST(FramingRoundTrip, EveryMessageKindReadsBackEqual) {
    JsonRpcResponse result;
    result.id = std::string("srv-7");
    result.result = nlohmann::json{{"content", {{{"type", "text"}, {"text", "ok"}}}}, {"isError", false}};

    JsonRpcResponse failure = make_error_response(RequestId{int64_t{12}}, error::InvalidParams, "bad arguments");
    failure.error->data = nlohmann::json{{"field", "text"}, {"expected", nlohmann::json::array({"string", "null"})}};

    JsonRpcResponse unknown_id;
    unknown_id.error = JsonRpcError{error::ParseError, "Parse error", std::nullopt};

    std::vector<JsonRpcMessage> messages = {
        make_request(11, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "hi"}, {"n", 3}}}}),
        result,
        failure,
        make_notification("notifications/message",
                          {{"level", "info"}, {"data", "Z\xc3\xbcrich \xe6\x9d\xb1\xe4\xba\xac \xf0\x9f\x8c\x8d"}}),
        unknown_id,
    };

    FeedPipe p;
    for (const auto& m : messages) p.feed(Framing::encode(m));

    for (const auto& m : messages) {
        EXPECT_EQ(Framing::read(*p.transport), m);
    }
}

TEST(FramingRoundTrip, NonAsciiBodyLengthIsInBytes) {
    auto notif = make_notification("notifications/message", {{"data", "\xe6\x9d\xb1\xe4\xba\xac"}});
    FeedPipe p;
    p.feed(Framing::encode(notif) + Framing::encode(make_request(2, "ping")));

    EXPECT_EQ(Framing::read(*p.transport), JsonRpcMessage{notif});
    EXPECT_EQ(Framing::read(*p.transport), JsonRpcMessage{make_request(2, "ping")});
}

TEST(FramingRead, ContentLengthMessage) {
    FeedPipe p;
    p.feed(Framing::encode(make_notification("notifications/message", {{"level", "info"}})));

    auto msg = Framing::read(*p.transport);
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/message");
}

TEST(FramingRead, BackToBackMessages) {
    FeedPipe p;
    p.feed(Framing::encode(make_request(1, "a")) + Framing::encode(make_request(2, "b")));

    auto first = Framing::read(*p.transport);
    auto second = Framing::read(*p.transport);
    EXPECT_EQ(std::get<JsonRpcRequest>(first).method, "a");
    EXPECT_EQ(std::get<JsonRpcRequest>(second).method, "b");
}

TEST(FramingRead, ExtraHeadersIgnored) {
    FeedPipe p;
    std::string body = R"({"jsonrpc":"2.0","id":3,"result":{}})";
    p.feed("Content-Type: application/vscode-jsonrpc\r\nContent-Length: "
           + std::to_string(body.size()) + "\r\n\r\n" + body);

    auto msg = Framing::read(*p.transport);
    EXPECT_EQ(std::get<int64_t>(*std::get<JsonRpcResponse>(msg).id), 3);
}

TEST(FramingRead, NewlineDelimitedMessage) {
    FeedPipe p;
    p.feed("\n" + Codec::serialize(make_request(5, "tools/list")) + "\n");

    auto msg = Framing::read(*p.transport);
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<int64_t>(std::get<JsonRpcRequest>(msg).id), 5);
}

TEST(FramingRead, MissingContentLength) {
    FeedPipe p;
    p.feed("X-Foo: bar\r\n\r\n{}");
    try {
        (void)Framing::read(*p.transport);
        FAIL() << "expected McpFramingError";
    } catch (const McpFramingError& e) {
        EXPECT_NE(std::string(e.what()).find("Content-Length"), std::string::npos);
    }
}

TEST(FramingRead, OversizedContentLength) {
    FeedPipe p;
    p.feed("Content-Length: " + std::to_string(Framing::kMaxContentLength + 1) + "\r\n\r\n");
    EXPECT_THROW((void)Framing::read(*p.transport), McpFramingError);
}

TEST(FramingRead, EofBeforeMessage) {
    FeedPipe p;
    p.close_input();
    EXPECT_THROW((void)Framing::read(*p.transport), McpConnectionClosedError);
}

TEST(FramingRead, EofInHeaders) {
    FeedPipe p;
    p.feed("Content-Length: 10\r\n");
    p.close_input();
    EXPECT_THROW((void)Framing::read(*p.transport), McpConnectionClosedError);
}

TEST(FramingRead, EofInBody) {
    FeedPipe p;
    p.feed("Content-Length: 100\r\n\r\n{\"jsonrpc\":");
    p.close_input();
    EXPECT_THROW((void)Framing::read(*p.transport), McpConnectionClosedError);
}

TEST(FramingRead, InvalidBody) {
    FeedPipe p;
    p.feed("Content-Length: 9\r\n\r\nnot json!");
    EXPECT_THROW((void)Framing::read(*p.transport), McpParseError);
}

TEST(FramingRead, ConnectionClosedIsTransportError) {
    FeedPipe p;
    p.close_input();
    EXPECT_THROW((void)Framing::read(*p.transport), McpTransportError);
}
