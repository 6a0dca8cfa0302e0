#include "libjsonselect/parse.hpp"
#include "benchmark/benchmark.h"
#include "libjsonselect/jsonselect.hpp"

static void BM_ParseShorthand(benchmark::State& state) {
  libjsonselect::Parser parser{};
  for (auto _ : state) {
    parser.parse("$.foo.bar");
  }
}

static void BM_ParseBracketed(benchmark::State& state) {
  libjsonselect::Parser parser{};
  for (auto _ : state) {
    parser.parse("$['foo']['bar']");
  }
}

static void BM_ParseEscapedNames(benchmark::State& state) {
  libjsonselect::Parser parser{};
  for (auto _ : state) {
    parser.parse("$['a\\u0041', \"\\uD83D\\uDE00\", 'it\\'s']");
  }
}

static void BM_ParseAndToString(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(
        libjsonselect::to_string(libjsonselect::parse("$..book[1:10:2].title")));
  }
}

BENCHMARK(BM_ParseShorthand);
BENCHMARK(BM_ParseBracketed);
BENCHMARK(BM_ParseEscapedNames);
BENCHMARK(BM_ParseAndToString);

BENCHMARK_MAIN();
