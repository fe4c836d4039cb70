#pragma once
#include "json_rpc.hpp"
#include "transport/stdio_transport.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

/// Message framing over a byte stream.
///
/// Messages are written as `Content-Length: <N>\r\n\r\n<json>`. On read, a
/// first non-blank line that already starts with '{' is taken as one
/// newline-delimited JSON message instead of a header, because peers differ
/// in which convention they speak.
class Framing {
public:
    /// Upper bound on a declared body length.
    static constexpr std::size_t kMaxContentLength = 64u * 1024u * 1024u;

    /// Header block plus payload for one message.
    [[nodiscard]] static std::string encode(const JsonRpcMessage& msg);

    /// Encode and write one message in a single write.
    static void write(StdioTransport& transport, const JsonRpcMessage& msg);

    /// Read one message.
    /// Throws McpConnectionClosedError at end of stream, McpFramingError when
    /// the header block has no usable length and McpParseError on a bad body.
    [[nodiscard]] static JsonRpcMessage read(StdioTransport& transport);

    /// Value of a `Content-Length:` header line, if the line is one and the
    /// value parses.
    [[nodiscard]] static std::optional<std::size_t> parse_content_length(std::string_view line);
};

} // namespace mcphub
