/// Echo peer: a minimal server speaking the framed protocol on stdin/stdout.
/// Usage: ./mcphub_echo_peer [--ndjson] [--hang] [--exit-after-init]
///
/// Tools: echo {text}, fail {message}, sleep {ms}.

#include <mcphub/mcphub.hpp>
#include <chrono>
#include <cstring>
#include <iostream>
#include <thread>

namespace {

struct PeerOptions {
    bool ndjson = false;
    bool hang = false;
    bool exit_after_init = false;
};

nlohmann::json tool_list() {
    auto object_schema = [](const char* prop, const char* type) {
        return nlohmann::json{
            {"type", "object"},
            {"properties", {{prop, {{"type", type}}}}}
        };
    };
    return nlohmann::json{{"tools", {
        {{"name", "echo"}, {"description", "Echo the text back"}, {"inputSchema", object_schema("text", "string")}},
        {{"name", "fail"}, {"description", "Always fails"}, {"inputSchema", object_schema("message", "string")}},
        {{"name", "sleep"}, {"description", "Sleep before answering"}, {"inputSchema", object_schema("ms", "integer")}}
    }}};
}

class EchoPeer {
public:
    explicit EchoPeer(PeerOptions opts) : opts_(opts) {}

    int run() {
        while (true) {
            mcphub::JsonRpcMessage msg;
            try {
                msg = mcphub::Framing::read(transport_);
            } catch (const mcphub::McpConnectionClosedError&) {
                return 0;
            }

            if (auto* notif = std::get_if<mcphub::JsonRpcNotification>(&msg)) {
                if (notif->method == "notifications/initialized" && opts_.exit_after_init) {
                    return 0;
                }
                continue;
            }
            if (auto* req = std::get_if<mcphub::JsonRpcRequest>(&msg)) {
                handle(*req);
            }
        }
    }

private:
    void handle(const mcphub::JsonRpcRequest& req) {
        nlohmann::json params = req.params ? *req.params : nlohmann::json::object();

        if (req.method == "initialize") {
            reply(req.id, {
                {"protocolVersion", params.value("protocolVersion", std::string(mcphub::PROTOCOL_VERSION))},
                {"capabilities", {{"tools", nlohmann::json::object()}}},
                {"serverInfo", {{"name", "echo-peer"}, {"version", std::string(mcphub::LIBRARY_VERSION)}}}
            });
        } else if (req.method == "tools/list") {
            reply(req.id, tool_list());
        } else if (req.method == "tools/call") {
            if (opts_.hang) return;
            call_tool(req.id, params);
        } else if (req.method == "ping") {
            reply(req.id, nlohmann::json::object());
        } else {
            fail(req.id, mcphub::error::MethodNotFound, "Method not found: " + req.method);
        }
    }

    void call_tool(const mcphub::RequestId& id, const nlohmann::json& params) {
        std::string name = params.value("name", "");
        nlohmann::json args = params.value("arguments", nlohmann::json::object());

        if (name == "echo") {
            std::string text = args.value("text", "");
            reply(id, {{"content", {{{"type", "text"}, {"text", text}}}}, {"isError", false}});
        } else if (name == "fail") {
            fail(id, mcphub::error::InternalError, args.value("message", std::string("tool failed")));
        } else if (name == "sleep") {
            std::this_thread::sleep_for(std::chrono::milliseconds(args.value("ms", 0)));
            reply(id, {{"content", {{{"type", "text"}, {"text", "slept"}}}}, {"isError", false}});
        } else {
            fail(id, mcphub::error::InvalidParams, "Unknown tool: " + name);
        }
    }

    void reply(const mcphub::RequestId& id, nlohmann::json result) {
        mcphub::JsonRpcResponse resp;
        resp.id = id;
        resp.result = std::move(result);
        send_with_chatter(resp);
    }

    void fail(const mcphub::RequestId& id, int code, std::string message) {
        send_with_chatter(mcphub::make_error_response(id, code, std::move(message)));
    }

    // Every answer is preceded by a log notification the client has to skip.
    void send_with_chatter(const mcphub::JsonRpcResponse& resp) {
        send(mcphub::make_notification("notifications/message",
                                       {{"level", "info"}, {"data", "answering"}}));
        send(resp);
    }

    void send(const mcphub::JsonRpcMessage& msg) {
        if (opts_.ndjson) {
            transport_.write_all(mcphub::Codec::serialize(msg) + "\n");
        } else {
            mcphub::Framing::write(transport_, msg);
        }
    }

    PeerOptions opts_;
    mcphub::StdioTransport transport_;
};

} // namespace

int main(int argc, char* argv[]) {
    PeerOptions opts;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--ndjson") == 0) {
            opts.ndjson = true;
        } else if (std::strcmp(argv[i], "--hang") == 0) {
            opts.hang = true;
        } else if (std::strcmp(argv[i], "--exit-after-init") == 0) {
            opts.exit_after_init = true;
        } else {
            std::cerr << "Usage: " << argv[0] << " [--ndjson] [--hang] [--exit-after-init]\n";
            return 2;
        }
    }

    try {
        EchoPeer peer{opts};
        return peer.run();
    } catch (const mcphub::McpError& e) {
        std::cerr << "echo-peer: " << e.what() << "\n";
        return 1;
    }
}
