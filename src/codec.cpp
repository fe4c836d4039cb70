#include "mcphub/codec.hpp"
#include "mcphub/error.hpp"
#include "mcphub/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcphub {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            switch (val.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(int64_t(val.get_int64()));
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(uint64_t(val.get_uint64()));
                default:
                    return nlohmann::json(double(val.get_double()));
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(val.get_bool()));
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw McpParseError("Unsupported JSON value");
    }
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }
    // Some peers leave out the version member; only a wrong version is rejected.
    if (j.contains("jsonrpc")) {
        const auto& version = j.at("jsonrpc");
        if (!version.is_string() || version.get<std::string>() != JSONRPC_VERSION) {
            throw McpParseError("Invalid jsonrpc version, expected '2.0'");
        }
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    try {
        if (has_method && has_id) {
            if (j.at("id").is_null()) {
                throw McpParseError("Request ID must not be null");
            }
            JsonRpcRequest req;
            from_json(j, req);
            return req;
        } else if (has_method) {
            JsonRpcNotification notif;
            from_json(j, notif);
            return notif;
        } else if (has_id) {
            JsonRpcResponse resp;
            from_json(j, resp);
            return resp;
        }
    } catch (const nlohmann::json::exception& e) {
        throw McpParseError(std::string("Malformed message: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw McpParseError(std::string("Malformed message: ") + e.what());
    }
    throw McpParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    // simdjson requires padded input
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::json_type type;
    error = doc.type().get(type);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }
    if (type != simdjson::ondemand::json_type::object) {
        throw McpParseError("Message must be a JSON object");
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root = doc.get_value();
        j = simdjson_to_nlohmann(root);
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON document");
        }
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcphub
