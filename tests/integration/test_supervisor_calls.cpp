#include <gtest/gtest.h>
#include "mcphub/supervisor.hpp"
#include "mcphub/error.hpp"
#include <chrono>
#include <future>
#include <string>
#include <vector>

using namespace mcphub;

#ifndef MCPHUB_ECHO_PEER_PATH
#error "MCPHUB_ECHO_PEER_PATH must point at the mcphub_echo_peer binary"
#endif

namespace {

PackageSpec echo_peer(const std::string& id, std::vector<std::string> args = {}) {
    PackageSpec spec;
    spec.id = id;
    spec.display_name = "echo-peer (" + id + ")";
    spec.launch.command = MCPHUB_ECHO_PEER_PATH;
    spec.launch.args = std::move(args);
    return spec;
}

Supervisor::Options echo_options() {
    Supervisor::Options opts;
    opts.catalog = PackageCatalog{};
    opts.catalog.add(echo_peer("echo"));
    opts.catalog.add(echo_peer("echo-ndjson", {"--ndjson"}));
    opts.catalog.add(echo_peer("echo-hang", {"--hang"}));
    opts.catalog.add(echo_peer("echo-exit", {"--exit-after-init"}));
    opts.worker_threads = 2;
    opts.request_timeout = std::chrono::milliseconds(5000);
    return opts;
}

std::string first_text(const nlohmann::json& result) {
    return result.at("content").at(0).at("text").get<std::string>();
}

} // anonymous namespace

class SupervisorCalls : public ::testing::Test {
protected:
    Supervisor sup_{echo_options()};
};

TEST_F(SupervisorCalls, Initialize) {
    sup_.start("echo", HostingMode::HubHosted);

    auto result = sup_.initialize("echo");
    EXPECT_EQ(result["serverInfo"]["name"], "echo-peer");
    EXPECT_EQ(result["protocolVersion"], "2025-11-05");

    auto again = sup_.initialize("echo");
    EXPECT_EQ(again, (nlohmann::json{{"already_initialized", true}}));
}

TEST_F(SupervisorCalls, ListToolsPerformsHandshake) {
    sup_.start("echo", HostingMode::HubHosted);

    auto result = sup_.list_tools("echo");
    ASSERT_TRUE(result["tools"].is_array());
    ASSERT_EQ(result["tools"].size(), 3u);
    EXPECT_EQ(result["tools"][0]["name"], "echo");
    EXPECT_EQ(result["tools"][1]["name"], "fail");
    EXPECT_EQ(result["tools"][2]["name"], "sleep");
}

TEST_F(SupervisorCalls, CallEcho) {
    sup_.start("echo", HostingMode::HubHosted);

    auto result = sup_.call_tool("echo", "echo", {{"text", "hello hub"}});
    EXPECT_EQ(first_text(result), "hello hub");
    EXPECT_EQ(result["isError"], false);
}

TEST_F(SupervisorCalls, NewlineDelimitedPeer) {
    sup_.start("echo-ndjson", HostingMode::ToolLaunched);

    EXPECT_EQ(sup_.list_tools("echo-ndjson")["tools"].size(), 3u);
    EXPECT_EQ(first_text(sup_.call_tool("echo-ndjson", "echo", {{"text", "nd"}})), "nd");
}

TEST_F(SupervisorCalls, ToolErrorIsProtocolError) {
    sup_.start("echo", HostingMode::HubHosted);

    try {
        sup_.call_tool("echo", "fail", {{"message", "boom"}});
        FAIL() << "expected McpProtocolError";
    } catch (const McpProtocolError& e) {
        EXPECT_EQ(e.code, error::InternalError);
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
    }

    // A protocol error leaves the connection usable.
    EXPECT_EQ(first_text(sup_.call_tool("echo", "echo", {{"text", "still here"}})), "still here");
}

TEST_F(SupervisorCalls, UnknownTool) {
    sup_.start("echo", HostingMode::HubHosted);
    try {
        sup_.call_tool("echo", "nope");
        FAIL() << "expected McpProtocolError";
    } catch (const McpProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
    }
}

TEST_F(SupervisorCalls, UnknownServer) {
    EXPECT_THROW(sup_.list_tools("echo"), McpNotFoundError);
    EXPECT_THROW(sup_.call_tool("missing", "echo"), McpNotFoundError);
}

TEST_F(SupervisorCalls, SlowToolWithinDeadline) {
    sup_.start("echo", HostingMode::HubHosted);
    auto result = sup_.call_tool("echo", "sleep", {{"ms", 50}}, std::chrono::milliseconds(2000));
    EXPECT_EQ(first_text(result), "slept");
}

TEST_F(SupervisorCalls, TimeoutMarksServerUnusable) {
    sup_.start("echo-hang", HostingMode::HubHosted);
    sup_.initialize("echo-hang");

    auto begin = std::chrono::steady_clock::now();
    try {
        sup_.call_tool("echo-hang", "echo", {{"text", "x"}}, std::chrono::milliseconds(200));
        FAIL() << "expected McpTimeoutError";
    } catch (const McpTimeoutError& e) {
        EXPECT_NE(std::string(e.what()).find("echo-hang"), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(3));

    try {
        sup_.list_tools("echo-hang");
        FAIL() << "expected McpTransportError";
    } catch (const McpTransportError& e) {
        EXPECT_NE(std::string(e.what()).find("request timed out"), std::string::npos);
    }

    // Stopping wakes the blocked worker and frees the name.
    sup_.stop("echo-hang");
    sup_.start("echo-hang", HostingMode::HubHosted);
    EXPECT_EQ(sup_.list_tools("echo-hang")["tools"].size(), 3u);
}

TEST(SupervisorSingleWorker, QueuedCallTimeoutLeavesServerUsable) {
    auto opts = echo_options();
    opts.worker_threads = 1;
    Supervisor sup(std::move(opts));

    sup.start("echo-hang", HostingMode::HubHosted);
    sup.start("echo", HostingMode::HubHosted);
    sup.initialize("echo-hang");
    sup.initialize("echo");

    // Occupies the only worker until echo-hang is stopped.
    EXPECT_THROW(sup.call_tool("echo-hang", "echo", {{"text", "x"}}, std::chrono::milliseconds(200)),
                 McpTimeoutError);

    try {
        sup.call_tool("echo", "echo", {{"text", "queued"}}, std::chrono::milliseconds(200));
        FAIL() << "expected McpTimeoutError";
    } catch (const McpTimeoutError& e) {
        EXPECT_NE(std::string(e.what()).find("waiting for a free worker"), std::string::npos);
    }

    // Freeing the worker is enough; "echo" was never marked unusable.
    sup.stop("echo-hang");
    auto result = sup.call_tool("echo", "echo", {{"text", "after"}});
    EXPECT_EQ(first_text(result), "after");
}

TEST_F(SupervisorCalls, PeerExitMarksServerUnusable) {
    sup_.start("echo-exit", HostingMode::HubHosted);
    sup_.initialize("echo-exit");

    EXPECT_THROW(sup_.list_tools("echo-exit"), McpTransportError);
    try {
        sup_.list_tools("echo-exit");
        FAIL() << "expected McpTransportError";
    } catch (const McpTransportError& e) {
        EXPECT_NE(std::string(e.what()).find("unusable"), std::string::npos);
    }
}

TEST_F(SupervisorCalls, ServersServedConcurrently) {
    sup_.start("echo", HostingMode::HubHosted);
    sup_.start("echo-ndjson", HostingMode::HubHosted);
    sup_.initialize("echo");
    sup_.initialize("echo-ndjson");

    auto begin = std::chrono::steady_clock::now();
    auto a = std::async(std::launch::async, [this] {
        return sup_.call_tool("echo", "sleep", {{"ms", 300}});
    });
    auto b = std::async(std::launch::async, [this] {
        return sup_.call_tool("echo-ndjson", "sleep", {{"ms", 300}});
    });
    EXPECT_EQ(first_text(a.get()), "slept");
    EXPECT_EQ(first_text(b.get()), "slept");
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(590));
}

TEST_F(SupervisorCalls, StatusAfterCalls) {
    sup_.start("echo", HostingMode::HubHosted);
    sup_.list_tools("echo");

    auto servers = sup_.get_servers();
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers[0].status, ServerState::Running);

    nlohmann::json j = servers[0];
    EXPECT_EQ(j["name"], "echo-peer (echo)");
    EXPECT_EQ(j["status"], "running");
}
