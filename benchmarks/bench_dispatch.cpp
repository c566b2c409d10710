#include <benchmark/benchmark.h>
#include "mcpserve/capability.hpp"
#include "mcpserve/logger.hpp"
#include "mcpserve/router.hpp"
#include "mcpserve/server.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace mcpserve;

namespace {

// A server past the handshake with one resource registered.
struct ReadyServer {
    ReadyServer()
        : notes(ResourceDefinition{"notes://scratch", "Scratch", std::nullopt, "text/plain"},
                std::string(256, 'n')),
          server(McpServer::Options{}) {
        mcpserve::log::set_level(spdlog::level::warn);
        server.add_resource(notes);
        auto init = server.handle(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})");
        benchmark::DoNotOptimize(init);
        auto ack = server.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
        benchmark::DoNotOptimize(ack);
    }

    TextResource notes;
    McpServer server;
};

void run(benchmark::State& state, McpServer& server, const std::string& raw) {
    for (auto _ : state) {
        auto reply = server.handle_json(raw);
        benchmark::DoNotOptimize(reply);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}

} // anonymous namespace

// Requests and notifications for the same method name take different paths.
static void BM_RouterRequestVsNotification(benchmark::State& state) {
    Router router;
    router.on_request("ping", [](const nlohmann::json&, const RequestContext&) -> HandlerResult {
        return nlohmann::json::object();
    });
    router.on_notification("notifications/initialized",
                           [](const nlohmann::json&, const RequestContext&) {});

    const JsonRpcMessage request = JsonRpcRequest{RequestId{int64_t{1}}, "ping", std::nullopt};
    const JsonRpcMessage note = JsonRpcNotification{"notifications/initialized", std::nullopt};
    const bool notify = state.range(0) != 0;
    for (auto _ : state) {
        auto out = router.dispatch(notify ? note : request, "sub-1");
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_RouterRequestVsNotification)->Arg(0)->Arg(1);

static void BM_ServerSubscribe(benchmark::State& state) {
    ReadyServer ready;
    run(state, ready.server,
        R"({"jsonrpc":"2.0","id":1,"method":"resources/subscribe","params":{"uri":"notes://scratch"}})");
}
BENCHMARK(BM_ServerSubscribe);

static void BM_ServerReadResource(benchmark::State& state) {
    ReadyServer ready;
    run(state, ready.server,
        R"({"jsonrpc":"2.0","id":"r","method":"resources/read","params":{"uri":"notes://scratch"}})");
}
BENCHMARK(BM_ServerReadResource);

// Nothing is serialized for a notification.
static void BM_ServerNotification(benchmark::State& state) {
    ReadyServer ready;
    run(state, ready.server, R"({"jsonrpc":"2.0","id":null,"method":"notifications/initialized"})");
}
BENCHMARK(BM_ServerNotification);

// Malformed input: unparsable text, a bad envelope with a recoverable id, and
// an unknown method.
static void BM_ServerRejects(benchmark::State& state) {
    static const std::vector<std::string> inputs = {
        R"({"jsonrpc":"2.0","id":1,"method":)",
        R"({"jsonrpc":"1.0","id":2,"method":"ping"})",
        R"({"jsonrpc":"2.0","id":3,"method":"no/such/method"})",
    };
    ReadyServer ready;
    run(state, ready.server, inputs[static_cast<size_t>(state.range(0))]);
}
BENCHMARK(BM_ServerRejects)->DenseRange(0, 2);

static void BM_ServerUpdateWithoutListeners(benchmark::State& state) {
    ReadyServer ready;
    for (auto _ : state) {
        bool ok = ready.server.update_resource("notes://scratch", "fresh");
        benchmark::DoNotOptimize(ok);
    }
}
BENCHMARK(BM_ServerUpdateWithoutListeners);
