#include <benchmark/benchmark.h>
#include "toolhost/frame_reader.hpp"
#include <string>

using namespace toolhost;

// 1000 tools/call frames back to back.
static std::string make_stream() {
    std::string frame =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello world"}}})";
    std::string out;
    for (int i = 0; i < 1000; ++i) {
        out += frame;
        out += '\n';
    }
    return out;
}

static const std::string kStream = make_stream();

static void BM_FrameReaderChunked(benchmark::State& state) {
    const size_t chunk = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        FrameReader reader;
        size_t frames = 0;
        for (size_t pos = 0; pos < kStream.size(); pos += chunk) {
            frames += reader.feed(std::string_view(kStream).substr(pos, chunk)).size();
        }
        benchmark::DoNotOptimize(frames);
    }
    state.SetBytesProcessed(state.iterations() * kStream.size());
}
BENCHMARK(BM_FrameReaderChunked)->Arg(1)->Arg(64)->Arg(4096)->Arg(65536)->MinTime(1.0);
