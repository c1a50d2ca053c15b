#include <benchmark/benchmark.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "encneg/accept-encoding.hpp"
#include "encneg/coding.hpp"
#include "encneg/encoding.hpp"
#include "encneg/http-constants.hpp"
#include "encneg/http-headers.hpp"

using namespace encneg;

namespace {

// Typical values sent by browsers and command line clients.
constexpr std::array<std::string_view, 6> kHeaderValues = {
    "gzip, deflate, br, zstd",
    "gzip, deflate, br",
    "gzip;q=1.0, identity; q=0.5, *;q=0",
    "br;q=1.0, gzip;q=0.8, *;q=0.1",
    "deflate, gzip;q=1.0, *;q=0.5",
    "identity",
};

const std::array<Coding, 4> kAvailable = {Encoding::zstd, Encoding::br, Encoding::gzip, Encoding::identity};

}  // namespace

// ------------------------------------------------------------
// Benchmarks
// ------------------------------------------------------------

static void BM_AcceptEncoding_Parse(benchmark::State& state) {
  for (auto _ : state) {
    for (std::string_view value : kHeaderValues) {
      benchmark::DoNotOptimize(AcceptEncoding::Parse(value));
    }
  }

  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * kHeaderValues.size()));
}

static void BM_AcceptEncoding_ParseAndNegotiate(benchmark::State& state) {
  for (auto _ : state) {
    for (std::string_view value : kHeaderValues) {
      auto accept = AcceptEncoding::Parse(value);
      benchmark::DoNotOptimize(accept.negotiate(kAvailable));
    }
  }

  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * kHeaderValues.size()));
}

static void BM_AcceptEncoding_FromHeadersSeveralOccurrences(benchmark::State& state) {
  http::Headers headers;
  headers.append("Host", "localhost");
  for (std::string_view value : kHeaderValues) {
    headers.append(http::AcceptEncoding, value);
  }

  for (auto _ : state) {
    benchmark::DoNotOptimize(AcceptEncoding::FromHeaders(headers));
  }
}

static void BM_AcceptEncoding_Value(benchmark::State& state) {
  const auto accept = AcceptEncoding::Parse(kHeaderValues[3]);

  for (auto _ : state) {
    benchmark::DoNotOptimize(accept.value());
  }
}

// ------------------------------------------------------------

BENCHMARK(BM_AcceptEncoding_Parse);
BENCHMARK(BM_AcceptEncoding_ParseAndNegotiate);
BENCHMARK(BM_AcceptEncoding_FromHeadersSeveralOccurrences);
BENCHMARK(BM_AcceptEncoding_Value);

BENCHMARK_MAIN();
