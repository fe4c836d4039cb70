#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcphub {

class Codec {
public:
    /// Parse one JSON document into a message.
    /// Throws McpParseError on invalid JSON or a malformed JSON-RPC envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Classify an already-parsed JSON object.
    [[nodiscard]] static JsonRpcMessage parse_object(const nlohmann::json& j);

    /// Serialize a message to compact JSON.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
};

} // namespace mcphub
