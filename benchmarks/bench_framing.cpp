#include <benchmark/benchmark.h>
#include "mcpserve/framing.hpp"
#include <string>

using namespace mcpserve;

// N newline-terminated ping requests back to back
static std::string make_stream(int n) {
    std::string out;
    for (int i = 0; i < n; ++i) {
        out += R"({"jsonrpc":"2.0","id":)" + std::to_string(i) + R"(,"method":"ping"})";
        out += '\n';
    }
    return out;
}

static void BM_FrameWholeBuffer(benchmark::State& state) {
    const std::string stream = make_stream(1000);
    for (auto _ : state) {
        LineFramer framer;
        size_t lines = 0;
        framer.feed(stream, [&](std::string) { ++lines; });
        benchmark::DoNotOptimize(lines);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FrameWholeBuffer);

// Same stream delivered in chunks of the given size
static void BM_FrameChunked(benchmark::State& state) {
    const std::string stream = make_stream(1000);
    const size_t chunk = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        LineFramer framer;
        size_t lines = 0;
        for (size_t off = 0; off < stream.size(); off += chunk) {
            framer.feed(std::string_view(stream).substr(off, chunk), [&](std::string) { ++lines; });
        }
        benchmark::DoNotOptimize(lines);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FrameChunked)->Arg(1)->Arg(64)->Arg(8192);

// One large record followed by an oversized one that must be discarded
static void BM_FrameOversized(benchmark::State& state) {
    const size_t limit = 64 * 1024;
    std::string stream(limit - 1, 'a');
    stream += '\n';
    stream += std::string(limit * 4, 'b');
    stream += '\n';
    for (auto _ : state) {
        LineFramer framer(limit);
        size_t overflows = 0;
        framer.feed(stream, [](std::string line) { benchmark::DoNotOptimize(line); },
                    [&](size_t) { ++overflows; });
        benchmark::DoNotOptimize(overflows);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FrameOversized);
