#include <benchmark/benchmark.h>
#include "mcphub/codec.hpp"
#include "mcphub/error.hpp"
#include "mcphub/framing.hpp"
#include "mcphub/session.hpp"
#include <unistd.h>
#include <memory>
#include <string>
#include <thread>

using namespace mcphub;

// ---- Framing ----

static void BM_FramingEncode(benchmark::State& state) {
    auto req = make_request(7, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "hello"}}}});
    for (auto _ : state) {
        auto framed = Framing::encode(req);
        benchmark::DoNotOptimize(framed);
    }
}
BENCHMARK(BM_FramingEncode)->MinTime(1.0);

static void BM_FramingReadBurst(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    std::string burst;
    for (int i = 0; i < n; ++i) {
        burst += Framing::encode(make_notification("notifications/progress", {{"progress", i}}));
    }

    for (auto _ : state) {
        state.PauseTiming();
        int fds[2];
        if (pipe(fds) < 0) {
            state.SkipWithError("pipe failed");
            break;
        }
        std::thread writer([&] {
            std::size_t off = 0;
            while (off < burst.size()) {
                ssize_t w = write(fds[1], burst.data() + off, burst.size() - off);
                if (w <= 0) break;
                off += static_cast<std::size_t>(w);
            }
            close(fds[1]);
        });
        // The transport only reads; give it a harmless write end.
        StdioTransport reader(fds[0], dup(STDERR_FILENO));
        state.ResumeTiming();

        for (int i = 0; i < n; ++i) {
            auto msg = Framing::read(reader);
            benchmark::DoNotOptimize(msg);
        }

        state.PauseTiming();
        writer.join();
        state.ResumeTiming();
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_FramingReadBurst)->Arg(100)->Arg(1000);

// ---- Session round trip over pipes ----

// Answers every request with an empty result until the session hangs up.
static void run_responder(std::unique_ptr<StdioTransport> transport) {
    try {
        while (true) {
            auto msg = Framing::read(*transport);
            if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
                JsonRpcResponse resp;
                resp.id = req->id;
                resp.result = nlohmann::json{{"content", nlohmann::json::array()}};
                Framing::write(*transport, resp);
            }
        }
    } catch (const McpConnectionClosedError&) {
        // session hung up
    }
}

static void BM_SessionCallTool(benchmark::State& state) {
    int to_peer[2], from_peer[2];
    if (pipe(to_peer) < 0 || pipe(from_peer) < 0) {
        state.SkipWithError("pipe failed");
        return;
    }

    std::thread responder(run_responder,
                          std::make_unique<StdioTransport>(to_peer[0], from_peer[1]));
    {
        Session session(std::make_unique<StdioTransport>(from_peer[0], to_peer[1]));
        session.initialize();

        for (auto _ : state) {
            auto result = session.call_tool("echo", {{"text", "ping"}});
            benchmark::DoNotOptimize(result);
        }
        state.SetItemsProcessed(state.iterations());
    }
    responder.join();
}
BENCHMARK(BM_SessionCallTool)->MinTime(1.0);
