#include <benchmark/benchmark.h>
#include <string>

#include "ipc/codec.hpp"
#include "terminal/escape_filter.hpp"
#include "terminal/utf8.hpp"

using namespace termpanel;

// --- Helpers ---

// Typical shell output: coloured ls lines, some box drawing, an occasional
// OSC colour query that the filter has to strip.
static std::string make_output(std::size_t bytes)
{
    static const std::string line =
        "\033[01;34mdrwxr-xr-x\033[0m  2 user user 4096 Jan  1 12:00 src \xE2\x94\x82 "
        "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E\r\n";
    static const std::string query = "\033]11;?\033\\";
    std::string              out;
    out.reserve(bytes + line.size());
    std::size_t n = 0;
    while (out.size() < bytes)
    {
        out += line;
        if (++n % 32 == 0)
            out += query;
    }
    return out;
}

// --- UTF-8 decoding ---

static void BM_Utf8Decode(benchmark::State& state)
{
    const auto        chunk = static_cast<std::size_t>(state.range(0));
    const std::string input = make_output(1 << 20);
    std::string       out;
    out.reserve(input.size());
    for (auto _ : state)
    {
        terminal::Utf8Decoder decoder;
        out.clear();
        for (std::size_t off = 0; off < input.size(); off += chunk)
            decoder.feed(std::string_view(input).substr(off, chunk), out);
        decoder.flush(out);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Utf8Decode)->Arg(7)->Arg(4096)->Arg(65536);

// --- Escape filtering ---

static void BM_EscapeFilter(benchmark::State& state)
{
    const auto        chunk = static_cast<std::size_t>(state.range(0));
    const std::string input = make_output(1 << 20);
    std::string       out;
    out.reserve(input.size());
    for (auto _ : state)
    {
        terminal::EscapeFilter filter;
        out.clear();
        for (std::size_t off = 0; off < input.size(); off += chunk)
            filter.feed(std::string_view(input).substr(off, chunk), out);
        filter.flush(out);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_EscapeFilter)->Arg(7)->Arg(4096)->Arg(65536);

// --- Full reader path: decode, filter, frame ---

static void BM_OutputPipeline(benchmark::State& state)
{
    const std::string input = make_output(1 << 20);
    const std::size_t chunk = 4096;
    std::string       text;
    std::string       filtered;
    for (auto _ : state)
    {
        terminal::Utf8Decoder  decoder;
        terminal::EscapeFilter filter;
        std::size_t            framed = 0;
        for (std::size_t off = 0; off < input.size(); off += chunk)
        {
            text.clear();
            filtered.clear();
            decoder.feed(std::string_view(input).substr(off, chunk), text);
            filter.feed(text, filtered);

            ipc::TerminalDataPayload p;
            p.session = "term-bench";
            p.data    = filtered;
            auto bytes = ipc::encode_terminal_data(p);
            framed += bytes.size();
        }
        benchmark::DoNotOptimize(framed);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_OutputPipeline);

BENCHMARK_MAIN();
