#include <benchmark/benchmark.h>
#include <promptvec/kernels/distance.hpp>
#include <promptvec/vector_database.hpp>

#include <random>
#include <string>
#include <vector>

using namespace promptvec;

namespace {

auto random_unit(std::mt19937& gen, std::size_t dim) -> std::vector<float> {
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto& x : v) x = dist(gen);
  kernels::normalize_in_place(v);
  return v;
}

auto populated(std::size_t n, std::size_t dim) -> std::unique_ptr<VectorDatabase> {
  DatabaseOptions options;
  options.config.dimension = dim;
  options.config.batch_pause = std::chrono::milliseconds(0);
  auto db = VectorDatabase::create(std::move(options));
  if (!db) return nullptr;
  std::mt19937 gen(7);
  std::vector<VectorDocument> docs;
  docs.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    VectorDocument d;
    d.id = "doc-" + std::to_string(i);
    d.vector = random_unit(gen, dim);
    d.metadata.domain = (i % 2 == 0) ? "sales" : "support";
    docs.push_back(std::move(d));
  }
  if (!(*db)->add_documents(std::move(docs))) return nullptr;
  return std::move(*db);
}

} // namespace

static void BenchCosine384(benchmark::State& state){
  std::mt19937 gen(1);
  auto a = random_unit(gen, 384), b = random_unit(gen, 384);
  for (auto _ : state) {
    benchmark::DoNotOptimize(kernels::cosine_similarity(a, b));
  }
}
BENCHMARK(BenchCosine384);

// Distinct queries so every iteration misses the result cache.
static void BenchSearchUncached(benchmark::State& state){
  const auto n = static_cast<std::size_t>(state.range(0));
  auto db = populated(n, 128);
  if (!db) { state.SkipWithError("setup failed"); return; }
  std::mt19937 gen(11);
  for (auto _ : state) {
    state.PauseTiming();
    search::SearchQuery q;
    q.vector = random_unit(gen, 128);
    q.limit = 10;
    q.threshold = 0.0f;
    state.ResumeTiming();
    benchmark::DoNotOptimize(db->search(q));
  }
}
BENCHMARK(BenchSearchUncached)->Arg(1000)->Arg(10000);

static void BenchSearchFiltered(benchmark::State& state){
  auto db = populated(5000, 128);
  if (!db) { state.SkipWithError("setup failed"); return; }
  std::mt19937 gen(13);
  auto query = random_unit(gen, 128);
  for (auto _ : state) {
    search::SearchQuery q;
    q.vector = query;
    q.filters.domains = {"sales"};
    q.limit = 10;
    q.threshold = 0.0f;
    benchmark::DoNotOptimize(db->search(q));
  }
}
BENCHMARK(BenchSearchFiltered);

static void BenchInsert(benchmark::State& state){
  DatabaseOptions options;
  options.config.dimension = 128;
  auto db = VectorDatabase::create(std::move(options));
  if (!db) { state.SkipWithError("setup failed"); return; }
  std::mt19937 gen(17);
  std::size_t i = 0;
  for (auto _ : state) {
    VectorDocument d;
    d.id = "doc-" + std::to_string(i++);
    d.vector = random_unit(gen, 128);
    benchmark::DoNotOptimize((*db)->add_document(std::move(d)));
  }
}
BENCHMARK(BenchInsert);

BENCHMARK_MAIN();
