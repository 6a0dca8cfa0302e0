#include "benchmark/benchmark.h"
#include "libjsonselect/jsonselect.hpp"
#include <json/json.h>
#include <string>

// A store with _books_ books, each with a title, a price and a list of tags.
static Json::Value make_store(int books) {
  Json::Value store{Json::objectValue};
  auto& book_list{store["store"]["book"]};
  book_list = Json::Value{Json::arrayValue};

  for (int i = 0; i < books; i++) {
    Json::Value book{Json::objectValue};
    book["title"] = "title " + std::to_string(i);
    book["price"] = i * 1.5;
    book["tags"].append("a");
    book["tags"].append("b");
    book_list.append(book);
  }
  return store;
}

static void BM_QueryChild(benchmark::State& state) {
  const auto document{make_store(static_cast<int>(state.range(0)))};
  const auto path{libjsonselect::parse("$.store.book[0].title")};
  for (auto _ : state) {
    benchmark::DoNotOptimize(libjsonselect::query(path, document));
  }
}

static void BM_QuerySlice(benchmark::State& state) {
  const auto document{make_store(static_cast<int>(state.range(0)))};
  const auto path{libjsonselect::parse("$.store.book[::-2].price")};
  for (auto _ : state) {
    benchmark::DoNotOptimize(libjsonselect::query(path, document));
  }
}

static void BM_QueryDescendant(benchmark::State& state) {
  const auto document{make_store(static_cast<int>(state.range(0)))};
  const auto path{libjsonselect::parse("$..title")};
  for (auto _ : state) {
    benchmark::DoNotOptimize(libjsonselect::query(path, document));
  }
}

static void BM_FindDescendantWild(benchmark::State& state) {
  const auto document{make_store(static_cast<int>(state.range(0)))};
  for (auto _ : state) {
    benchmark::DoNotOptimize(libjsonselect::find("$..*", document));
  }
}

BENCHMARK(BM_QueryChild)->Arg(10)->Arg(1000);
BENCHMARK(BM_QuerySlice)->Arg(10)->Arg(1000);
BENCHMARK(BM_QueryDescendant)->Arg(10)->Arg(1000);
BENCHMARK(BM_FindDescendantWild)->Arg(10)->Arg(1000);

BENCHMARK_MAIN();
