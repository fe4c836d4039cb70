#include <benchmark/benchmark.h>
#include "mcphub/codec.hpp"
#include "mcphub/error.hpp"
#include "mcphub/json_rpc.hpp"
#include <string>

using namespace mcphub;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"memory_search","arguments":{"query":"release checklist","limit":20}}})";

static const std::string kLogNotification =
    R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info","logger":"core","data":"indexing 128 files"}})";

// tools/list response with n tools, the largest message a hub routinely reads
static std::string make_tool_list(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Workflow tool number " + std::to_string(i) + " exposed by the package"},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"path", {{"type", "string"}, {"description", "Target path"}}},
                    {"depth", {{"type", "integer"}, {"description", "Recursion depth"}}}
                }},
                {"required", {"path"}}
            }}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 2},
        {"result", {{"tools", tools}}}
    };
    return resp.dump();
}

static const std::string kToolList = make_tool_list(100);

// ---- Parse benchmarks ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseNotification(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLogNotification);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLogNotification.size());
}
BENCHMARK(BM_ParseNotification)->MinTime(1.0);

static void BM_ParseToolList(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolList);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolList.size());
}
BENCHMARK(BM_ParseToolList)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeRequest(benchmark::State& state) {
    auto req = make_request(1, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "hi"}}}});
    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeRequest)->MinTime(1.0);

static void BM_SerializeToolList(benchmark::State& state) {
    auto msg = Codec::parse(kToolList);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kToolList.size());
}
BENCHMARK(BM_SerializeToolList)->MinTime(1.0);
