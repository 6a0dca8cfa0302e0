#include "libjsonselect/lex.hpp"
#include "benchmark/benchmark.h"

static void BM_LexShorthand(benchmark::State& state) {
  for (auto _ : state) {
    libjsonselect::Lexer lexer{"$.foo.bar"};
    lexer.run();
  }
}
// Register the function as a benchmark
BENCHMARK(BM_LexShorthand);

static void BM_LexBracketed(benchmark::State& state) {
  for (auto _ : state) {
    libjsonselect::Lexer lexer{"$['foo']['bar']"};
    lexer.run();
  }
}
// Register the function as a benchmark
BENCHMARK(BM_LexBracketed);

static void BM_LexUnionAndSlice(benchmark::State& state) {
  for (auto _ : state) {
    libjsonselect::Lexer lexer{"$..store[0, -1, 'a\\u0041', 1:10:2]"};
    lexer.run();
  }
}
BENCHMARK(BM_LexUnionAndSlice);

BENCHMARK_MAIN();
