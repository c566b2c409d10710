#include <benchmark/benchmark.h>
#include "mcpserve/base64.hpp"
#include "mcpserve/codec.hpp"
#include "mcpserve/error.hpp"
#include "mcpserve/json_rpc.hpp"
#include <string>

using namespace mcpserve;

namespace {

const std::string kPing = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

const std::string kSubscribe =
    R"({"jsonrpc":"2.0","id":"sub-7","method":"resources/subscribe","params":{"uri":"file:///var/log/app.log"}})";

// A resources/read reply with one text entry of `bytes` characters.
std::string make_read_reply(size_t bytes) {
    nlohmann::json contents = nlohmann::json::array({{
        {"uri", "file:///var/log/app.log"},
        {"mimeType", "text/plain"},
        {"text", std::string(bytes, 'a')}
    }});
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 3}, {"result", {{"contents", contents}}}}.dump();
}

const std::string kReadReply = make_read_reply(64 * 1024);

} // anonymous namespace

// ---- Decode ----

static void BM_DecodePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_DecodePing);

static void BM_DecodeSubscribe(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSubscribe);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSubscribe.size());
}
BENCHMARK(BM_DecodeSubscribe);

static void BM_DecodeLargeReply(benchmark::State& state) {
    for (auto _ : state) {
        auto doc = Codec::parse_json(kReadReply);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(state.iterations() * kReadReply.size());
}
BENCHMARK(BM_DecodeLargeReply);

// Parses as JSON but fails envelope checks; the id is still recovered.
static void BM_RejectEnvelope(benchmark::State& state) {
    const std::string no_method = R"({"jsonrpc":"2.0","id":9,"params":{}})";
    for (auto _ : state) {
        auto doc = Codec::parse_json(no_method);
        try {
            auto msg = Codec::to_message(doc);
            benchmark::DoNotOptimize(msg);
        } catch (const McpProtocolError&) {
            auto id = Codec::extract_id(doc);
            benchmark::DoNotOptimize(id);
        }
    }
}
BENCHMARK(BM_RejectEnvelope);

// ---- Encode ----

static void BM_EncodeUpdatedNotification(benchmark::State& state) {
    JsonRpcNotification notif{"notifications/resources/updated", nlohmann::json{
        {"uri", "file:///var/log/app.log"}, {"name", "app.log"}, {"mimeType", "text/plain"}
    }};
    for (auto _ : state) {
        auto s = Codec::serialize(notif);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeUpdatedNotification);

static void BM_EncodeLargeReply(benchmark::State& state) {
    auto msg = Codec::parse(kReadReply);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kReadReply.size());
}
BENCHMARK(BM_EncodeLargeReply);

static void BM_Base64Blob(benchmark::State& state) {
    const std::string bytes(static_cast<size_t>(state.range(0)), '\x7f');
    for (auto _ : state) {
        auto s = base64_encode(bytes);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Base64Blob)->Arg(1024)->Arg(64 * 1024);
