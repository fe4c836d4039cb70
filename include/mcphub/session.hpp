#pragma once
#include "json_rpc.hpp"
#include "version.hpp"
#include "transport/stdio_transport.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcphub {

enum class SessionState {
    Uninitialized,
    Initialized
};

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;
};

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

/// Client side of one peer connection.
///
/// Requests block the calling thread until the response carrying the same id
/// arrives; notifications and unrelated responses read in between are
/// dropped. There is no internal timeout. Only one request may be awaited at
/// a time: a second thread calling in concurrently can have its response
/// consumed and discarded by the first.
class Session {
public:
    struct Options {
        Implementation client_info{std::string(CLIENT_NAME), std::nullopt, std::string(CLIENT_VERSION)};
        std::string protocol_version{PROTOCOL_VERSION};
    };

    explicit Session(std::unique_ptr<StdioTransport> transport);
    Session(std::unique_ptr<StdioTransport> transport, Options opts);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool is_initialized() const;

    /// Perform the handshake. Returns the peer's initialize result, or
    /// {"already_initialized": true} without any I/O when already done.
    nlohmann::json initialize();

    /// Invoke a tool; returns the peer's result verbatim.
    /// Throws McpContractError before initialize().
    nlohmann::json call_tool(const std::string& name,
                             const nlohmann::json& arguments = nlohmann::json::object());

    /// Throws McpContractError before initialize().
    nlohmann::json list_tools();

    /// Send a request and wait for its response. Error responses throw McpProtocolError.
    nlohmann::json send_request(const std::string& method,
                                nlohmann::json params = nlohmann::json::object());

    void send_notification(const std::string& method,
                           nlohmann::json params = nlohmann::json::object());

    /// Id the next request will carry.
    [[nodiscard]] int64_t peek_next_id() const;

    /// Release any thread blocked waiting for a response; the Session is unusable afterwards.
    void shutdown();

private:
    void require_initialized(const char* operation) const;
    JsonRpcResponse await_response(int64_t id);
    void reject_peer_request(const JsonRpcRequest& req);

    Options opts_;
    std::unique_ptr<StdioTransport> transport_;

    std::atomic<int64_t> next_id_{1};
    std::atomic<SessionState> state_{SessionState::Uninitialized};

    std::mutex init_mutex_;
    std::mutex write_mutex_;
    std::mutex read_mutex_;
};

} // namespace mcphub
