#pragma once
#include <string_view>

namespace mcphub {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

// Identity announced in the initialize handshake.
constexpr std::string_view CLIENT_NAME         = "aidd-hub";
constexpr std::string_view CLIENT_VERSION      = "1.0.0";

} // namespace mcphub
