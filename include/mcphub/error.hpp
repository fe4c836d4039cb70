#pragma once
#include <stdexcept>
#include <string>

namespace mcphub {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// Error response returned by the peer.
class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError("JSON-RPC error " + std::to_string(code) + ": " + msg), code(code) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// The peer's output ended while a header or body was expected.
class McpConnectionClosedError : public McpTransportError {
public:
    using McpTransportError::McpTransportError;
};

/// Header block without a usable Content-Length.
class McpFramingError : public McpTransportError {
public:
    using McpTransportError::McpTransportError;
};

class McpTimeoutError : public McpError {
public:
    using McpError::McpError;
};

/// Operation invoked in a state that forbids it (e.g. a tool call before the handshake).
class McpContractError : public McpError {
public:
    using McpError::McpError;
};

// ---- Supervisor lifecycle errors ----

class McpLifecycleError : public McpError {
public:
    using McpError::McpError;
};

class McpConfigError : public McpLifecycleError {
public:
    using McpLifecycleError::McpLifecycleError;
};

class McpAlreadyRunningError : public McpLifecycleError {
public:
    using McpLifecycleError::McpLifecycleError;
};

class McpNotFoundError : public McpLifecycleError {
public:
    using McpLifecycleError::McpLifecycleError;
};

class McpSpawnError : public McpLifecycleError {
public:
    using McpLifecycleError::McpLifecycleError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace mcphub
