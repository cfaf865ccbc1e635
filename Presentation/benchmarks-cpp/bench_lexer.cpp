#include <benchmark/benchmark.h>
#include "../../Domain/casbench-lang/lexer.hpp"

static const char* kOperation   = "diff(e, x, 10)";
static const char* kAssertClose = "evalf(subs(result, x, 1.0)) == 0.5678";

static void BM_LexOperation(benchmark::State& state) {
  for (auto _ : state) {
    casbench::Lexer lx(kOperation);
    benchmark::DoNotOptimize(lx.tokens().size());
  }
}

BENCHMARK(BM_LexOperation);

static void BM_LexAssertClose(benchmark::State& state) {
  for (auto _ : state) {
    casbench::Lexer lx(kAssertClose);
    benchmark::DoNotOptimize(lx.tokens().size());
  }
}

BENCHMARK(BM_LexAssertClose);

static void BM_CachedTokens(benchmark::State& state) {
  casbench::Lexer lx(kAssertClose);
  (void)lx.tokens();
  for (auto _ : state) {
    benchmark::DoNotOptimize(lx.tokens().data());
  }
}

BENCHMARK(BM_CachedTokens);

static void BM_LexFailure(benchmark::State& state) {
  for (auto _ : state) {
    casbench::Lexer lx("evalf(subs(result, x, 1.0.0))");
    benchmark::DoNotOptimize(lx.try_tokens().ok());
  }
}

BENCHMARK(BM_LexFailure);

BENCHMARK_MAIN();
