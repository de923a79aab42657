#include <orby/orby.hpp>
#include <orby/simd_impl.hpp>
#include <benchmark/benchmark.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <vector>

using namespace orby;

namespace {

constexpr size_t DIM = 4;

std::unique_ptr<Orby> make_engine(size_t capacity,
                                  std::optional<std::filesystem::path> vault =
                                      std::nullopt) {
  EngineConfigBuilder b("bench");
  b.capacity(capacity).dimension(DIM).log_level(spdlog::level::off);
  if (vault)
    b.vault(*vault).autoload(false);
  return std::move(Orby::create(b.build().value()).value());
}

// Row k: (k, k % 1000, random, random). Lane 1 has 1000 distinct values.
std::vector<Row> generate_rows(size_t count, uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::vector<Row> rows(count, Row(DIM));
  for (size_t k = 0; k < count; ++k) {
    rows[k][0] = Cell(k + 1);
    rows[k][1] = Cell(k % 1000 + 1);
    rows[k][2] = Cell(rng(), rng());
    rows[k][3] = Cell(rng());
  }
  return rows;
}

// Function to flush CPU caches by reading/writing a large buffer
void flush_cache() {
  constexpr size_t CACHE_SIZE = 64 * 1024 * 1024; // larger than typical L3
  static std::vector<char> dummy(CACHE_SIZE);
  for (size_t i = 0; i < CACHE_SIZE; i += 64) {
    dummy[i] += 1;
  }
  benchmark::DoNotOptimize(dummy.data());
}

} // namespace

// ----------------------------------------------------------------------------
// 1. Scan kernel throughput
// ----------------------------------------------------------------------------
static void BM_MatchEqKernel(benchmark::State &state) {
  const size_t n = static_cast<size_t>(state.range(0));
  std::vector<Cell> cells(n);
  for (size_t i = 0; i < n; ++i)
    cells[i] = Cell(i % 257);
  auto kernel = simd::get_best_match_eq_impl();
  std::vector<size_t> out;
  out.reserve(n / 257 + 1);

  for (auto _ : state) {
    out.clear();
    kernel(cells, Cell(7), 0, out);
    benchmark::DoNotOptimize(out.data());
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                          static_cast<int64_t>(n * CELL_BYTES));
}
BENCHMARK(BM_MatchEqKernel)->Arg(1 << 12)->Arg(1 << 16)->Arg(1 << 20);

// ----------------------------------------------------------------------------
// 2. Batch insert into a wrapping ring
// ----------------------------------------------------------------------------
static void BM_InsertBatch(benchmark::State &state) {
  const size_t batch = static_cast<size_t>(state.range(0));
  auto engine = make_engine(1 << 16);
  auto rows = generate_rows(batch, 1);

  for (auto _ : state) {
    auto r = engine->insert_batch(rows);
    benchmark::DoNotOptimize(r);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                          static_cast<int64_t>(batch));
}
BENCHMARK(BM_InsertBatch)->Arg(1)->Arg(64)->Arg(4096);

// ----------------------------------------------------------------------------
// 3. Lookups over a full engine
// ----------------------------------------------------------------------------
class EngineFixture : public benchmark::Fixture {
public:
  std::unique_ptr<Orby> engine;

  void SetUp(const benchmark::State &) override {
    if (engine)
      return;
    engine = make_engine(1 << 20);
    auto rows = generate_rows(1 << 20, 2);
    auto r = engine->insert_batch(rows);
    benchmark::DoNotOptimize(r);
  }

  void TearDown(const benchmark::State &) override {}
};

BENCHMARK_F(EngineFixture, FindByWarm)(benchmark::State &state) {
  const Cell targets[] = {Cell(42)};
  for (auto _ : state) {
    auto rows = engine->find_by(1, targets);
    benchmark::DoNotOptimize(rows);
  }
}

BENCHMARK_F(EngineFixture, FindByCold)(benchmark::State &state) {
  const Cell targets[] = {Cell(42)};
  for (auto _ : state) {
    state.PauseTiming();
    flush_cache();
    state.ResumeTiming();

    auto rows = engine->find_by(1, targets);
    benchmark::DoNotOptimize(rows);
  }
}

BENCHMARK_F(EngineFixture, FindByLimited)(benchmark::State &state) {
  const Cell targets[] = {Cell(42)};
  for (auto _ : state) {
    auto rows = engine->find_by(1, targets, 10);
    benchmark::DoNotOptimize(rows);
  }
}

BENCHMARK_F(EngineFixture, PredicateQuery)(benchmark::State &state) {
  for (auto _ : state) {
    auto rows = engine->query(
        3, [](const Cell &c) { return (c.lo & 0xFFFF) == 0; });
    benchmark::DoNotOptimize(rows);
  }
}

// ----------------------------------------------------------------------------
// 4. Sleep: full lane write with fsync
// ----------------------------------------------------------------------------
static void BM_Sleep(benchmark::State &state) {
  const auto dir = std::filesystem::temp_directory_path() / "orby_bench_vault";
  std::filesystem::remove_all(dir);
  auto engine = make_engine(static_cast<size_t>(state.range(0)), dir);
  auto rows = generate_rows(static_cast<size_t>(state.range(0)), 3);
  auto r = engine->insert_batch(rows);
  benchmark::DoNotOptimize(r);

  for (auto _ : state) {
    auto ok = engine->sleep();
    benchmark::DoNotOptimize(ok);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                          state.range(0) * static_cast<int64_t>(DIM) *
                          static_cast<int64_t>(CELL_BYTES));
  engine.reset();
  std::filesystem::remove_all(dir);
}
BENCHMARK(BM_Sleep)->Arg(1 << 14)->Arg(1 << 18)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
