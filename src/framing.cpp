#include "mcphub/framing.hpp"
#include "mcphub/codec.hpp"
#include "mcphub/error.hpp"
#include <cctype>
#include <charconv>
#include <string>

namespace mcphub {

namespace {

constexpr std::string_view kContentLength = "Content-Length:";

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

std::string Framing::encode(const JsonRpcMessage& msg) {
    std::string payload = Codec::serialize(msg);
    std::string out = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
    out += payload;
    return out;
}

void Framing::write(StdioTransport& transport, const JsonRpcMessage& msg) {
    transport.write_all(encode(msg));
}

std::optional<std::size_t> Framing::parse_content_length(std::string_view line) {
    line = trim(line);
    if (line.substr(0, kContentLength.size()) != kContentLength) {
        return std::nullopt;
    }
    std::string_view value = trim(line.substr(kContentLength.size()));
    if (value.empty()) return std::nullopt;

    std::size_t length = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc() || end != value.data() + value.size()) {
        return std::nullopt;
    }
    return length;
}

JsonRpcMessage Framing::read(StdioTransport& transport) {
    std::string line;
    std::string_view first;

    while (true) {
        if (!transport.read_line(line)) {
            throw McpConnectionClosedError("Server closed connection (EOF)");
        }
        first = trim(line);
        if (first.empty()) continue;

        // Newline-delimited peer
        if (first.front() == '{') {
            return Codec::parse(first);
        }
        break;
    }

    std::optional<std::size_t> content_length = parse_content_length(first);

    while (true) {
        if (!transport.read_line(line)) {
            throw McpConnectionClosedError("Server closed connection while reading headers");
        }
        std::string_view header = trim(line);
        if (header.empty()) break;
        if (auto len = parse_content_length(header)) {
            content_length = len;
        }
    }

    if (!content_length) {
        throw McpFramingError("Missing Content-Length header in MCP response");
    }
    if (*content_length > kMaxContentLength) {
        throw McpFramingError("Content-Length " + std::to_string(*content_length)
                              + " exceeds limit of " + std::to_string(kMaxContentLength) + " bytes");
    }

    std::string body;
    if (!transport.read_exact(*content_length, body)) {
        throw McpConnectionClosedError("Server closed connection while reading body");
    }
    return Codec::parse(body);
}

} // namespace mcphub
