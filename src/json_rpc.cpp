#include "mcphub/json_rpc.hpp"
#include "mcphub/version.hpp"

namespace mcphub {

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;  // null unless the id is known
    if (r.id) to_json(id_j, *r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.result) j["result"] = *r.result;
    if (r.error) j["error"] = *r.error;
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    const auto& id_j = j.at("id");
    if (id_j.is_null()) {
        r.id.reset();
    } else {
        RequestId id;
        from_json(id_j, id);
        r.id = std::move(id);
    }
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    n.method = j.at("method").get<std::string>();
    if (j.contains("params")) n.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

JsonRpcRequest make_request(int64_t id, std::string method, nlohmann::json params) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = std::move(method);
    req.params = std::move(params);
    return req;
}

JsonRpcNotification make_notification(std::string method, nlohmann::json params) {
    JsonRpcNotification notif;
    notif.method = std::move(method);
    notif.params = std::move(params);
    return notif;
}

JsonRpcResponse make_error_response(RequestId id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

} // namespace mcphub
