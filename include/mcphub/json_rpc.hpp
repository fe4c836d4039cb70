#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcphub {

/// Peers may use integer or string ids; the hub only ever issues integers.
using RequestId = std::variant<int64_t, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

// Peers do not always fill in both fields; fall back instead of rejecting the response.
inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = -1;
    e.message = "Unknown error";
    if (j.contains("code") && j.at("code").is_number_integer()) {
        e.code = j.at("code").get<int>();
    }
    if (j.contains("message") && j.at("message").is_string()) {
        e.message = j.at("message").get<std::string>();
    }
    if (j.contains("data")) e.data = j.at("data");
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcResponse {
    /// Empty when the peer answered with `"id": null` because it could not
    /// read the request id. Such a response never matches a pending request.
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

// ---- Builders ----

[[nodiscard]] JsonRpcRequest make_request(int64_t id, std::string method,
                                          nlohmann::json params = nlohmann::json::object());
[[nodiscard]] JsonRpcNotification make_notification(std::string method,
                                                    nlohmann::json params = nlohmann::json::object());
[[nodiscard]] JsonRpcResponse make_error_response(RequestId id, int code, std::string message);

} // namespace mcphub
