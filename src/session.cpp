#include "mcphub/session.hpp"
#include "mcphub/error.hpp"
#include "mcphub/framing.hpp"
#include "mcphub/log.hpp"
#include <string>
#include <utility>

namespace mcphub {

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
    if (j.contains("title")) t.title = j.at("title").get<std::string>();
}

Session::Session(std::unique_ptr<StdioTransport> transport)
    : Session(std::move(transport), Options{}) {}

Session::Session(std::unique_ptr<StdioTransport> transport, Options opts)
    : opts_(std::move(opts)), transport_(std::move(transport)) {
    if (!transport_) {
        throw McpContractError("Session requires a transport");
    }
}

Session::~Session() = default;

SessionState Session::state() const {
    return state_;
}

bool Session::is_initialized() const {
    return state_ == SessionState::Initialized;
}

int64_t Session::peek_next_id() const {
    return next_id_;
}

void Session::require_initialized(const char* operation) const {
    if (!is_initialized()) {
        throw McpContractError(std::string("Client not initialized. Call initialize() before ")
                               + operation + ".");
    }
}

nlohmann::json Session::initialize() {
    if (is_initialized()) {
        return nlohmann::json{{"already_initialized", true}};
    }

    std::lock_guard<std::mutex> lock(init_mutex_);
    // Another thread may have finished the handshake while we waited.
    if (is_initialized()) {
        return nlohmann::json{{"already_initialized", true}};
    }

    nlohmann::json params = {
        {"protocolVersion", opts_.protocol_version},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", opts_.client_info}
    };
    nlohmann::json result = send_request("initialize", std::move(params));

    send_notification("notifications/initialized");

    state_ = SessionState::Initialized;
    return result;
}

nlohmann::json Session::call_tool(const std::string& name, const nlohmann::json& arguments) {
    require_initialized("call_tool");
    return send_request("tools/call", {{"name", name}, {"arguments", arguments}});
}

nlohmann::json Session::list_tools() {
    require_initialized("list_tools");
    return send_request("tools/list", nlohmann::json::object());
}

nlohmann::json Session::send_request(const std::string& method, nlohmann::json params) {
    int64_t id = next_id_.fetch_add(1);

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        Framing::write(*transport_, make_request(id, method, std::move(params)));
    }

    JsonRpcResponse resp = await_response(id);
    if (resp.error) {
        throw McpProtocolError(resp.error->code, resp.error->message);
    }
    return resp.result ? std::move(*resp.result) : nlohmann::json(nullptr);
}

void Session::send_notification(const std::string& method, nlohmann::json params) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    Framing::write(*transport_, make_notification(method, std::move(params)));
}

JsonRpcResponse Session::await_response(int64_t id) {
    std::lock_guard<std::mutex> lock(read_mutex_);

    while (true) {
        JsonRpcMessage msg = Framing::read(*transport_);

        if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            const auto* resp_id = resp->id ? std::get_if<int64_t>(&*resp->id) : nullptr;
            if (resp_id && *resp_id == id) {
                return std::move(*resp);
            }
            nlohmann::json stray_id;
            if (resp->id) to_json(stray_id, *resp->id);
            log::debug("Discarding response with unexpected id {} (waiting for {})",
                       stray_id.dump(), id);
        } else if (auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
            log::debug("Skipping notification '{}' while waiting for response {}",
                       notif->method, id);
        } else if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            reject_peer_request(*req);
        }
    }
}

void Session::reject_peer_request(const JsonRpcRequest& req) {
    log::debug("Rejecting peer-initiated request '{}'", req.method);
    std::lock_guard<std::mutex> lock(write_mutex_);
    Framing::write(*transport_, make_error_response(req.id, error::MethodNotFound,
                                                    "Method not found: " + req.method));
}

void Session::shutdown() {
    transport_->shutdown();
}

} // namespace mcphub
