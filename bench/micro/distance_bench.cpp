#include <benchmark/benchmark.h>
#include <facet/kernels/distance.hpp>
#include <vector>

using namespace facet::kernels;

static void BenchIP768(benchmark::State& state){
  std::vector<float> a(768), b(768);
  for (int i=0;i<768;++i){ a[i]=i*0.5f; b[i]=(767-i)*0.25f; }
  for (auto _ : state) {
    benchmark::DoNotOptimize(inner_product(a, b));
  }
}
BENCHMARK(BenchIP768);

static void BenchNormalizedMean768(benchmark::State& state){
  std::vector<float> a(768), b(768);
  for (int i=0;i<768;++i){ a[i]=i*1.0f; b[i]=(767-i)*1.0f; }
  for (auto _ : state) {
    auto m = normalized_mean(a, b);
    benchmark::DoNotOptimize(m.data());
  }
}
BENCHMARK(BenchNormalizedMean768);

BENCHMARK_MAIN();
