// Performance benchmarks for textscrub normalization and diffing
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed seeds so runs are comparable

#include <benchmark/benchmark.h>

#include <textscrub/diff.hpp>
#include <textscrub/normalize.hpp>
#include <textscrub/test_utils.hpp>

#include <string>

namespace {

// Roughly state.range(0) bytes of generated text
std::string MessyText(size_t bytes, uint32_t seed = 7) {
  textscrub::testing::RandomTextGenerator gen(seed);
  std::string text;
  while (text.size() < bytes) {
    text += gen.Next(16);
  }
  return text;
}

// =============================================================================
// Normalizer
// =============================================================================

static void BM_Normalize_Ascii(benchmark::State& state) {
  std::string input(static_cast<size_t>(state.range(0)), 'a');
  for (size_t i = 7; i < input.size(); i += 8) input[i] = ' ';
  for (auto _ : state) {
    auto result = textscrub::Normalize(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Normalize_Ascii)->Range(64, 1 << 20);

static void BM_Normalize_Messy(benchmark::State& state) {
  const std::string input = MessyText(static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto result = textscrub::Normalize(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Normalize_Messy)->Range(64, 1 << 20);

static void BM_Normalize_KeyboardOnly(benchmark::State& state) {
  textscrub::RuleOptions options;
  options.keyboard_only = true;
  const textscrub::Normalizer normalizer(textscrub::MakeRuleSet(options));
  const std::string input = MessyText(static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto result = normalizer.Normalize(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Normalize_KeyboardOnly)->Range(64, 1 << 16);

// =============================================================================
// Differencer
// =============================================================================

// Sparse edits: the common case of mostly clean text
static void BM_Diff_SparseEdits(benchmark::State& state) {
  std::string original;
  while (original.size() < static_cast<size_t>(state.range(0))) {
    original += "The quick brown fox \xE2\x80\x94 jumps over the lazy dog.\n";
  }
  const std::string canonical = textscrub::Normalize(original);
  textscrub::DiffOptions options;
  options.max_alignment_cells = 0;
  for (auto _ : state) {
    auto result = textscrub::Diff(original, canonical, options);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(original.size()));
}
BENCHMARK(BM_Diff_SparseEdits)->Range(64, 1 << 14);

static void BM_Diff_Messy(benchmark::State& state) {
  const std::string original = MessyText(static_cast<size_t>(state.range(0)));
  const std::string canonical = textscrub::Normalize(original);
  textscrub::DiffOptions options;
  options.max_alignment_cells = 0;
  for (auto _ : state) {
    auto result = textscrub::Diff(original, canonical, options);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(original.size()));
}
BENCHMARK(BM_Diff_Messy)->Range(64, 1 << 14);

static void BM_Diff_Lines(benchmark::State& state) {
  const std::string original = MessyText(static_cast<size_t>(state.range(0)));
  const std::string canonical = textscrub::Normalize(original);
  textscrub::DiffOptions options;
  options.max_alignment_cells = 0;
  options.granularity = textscrub::DiffGranularity::kLine;
  for (auto _ : state) {
    auto result = textscrub::Diff(original, canonical, options);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(original.size()));
}
BENCHMARK(BM_Diff_Lines)->Range(1 << 10, 1 << 18);

// Refusal must not depend on input size beyond decoding
static void BM_Diff_BudgetRefusal(benchmark::State& state) {
  const std::string original = MessyText(static_cast<size_t>(state.range(0)));
  const std::string canonical = textscrub::Normalize(original);
  textscrub::DiffOptions options;
  options.max_alignment_cells = 1;
  for (auto _ : state) {
    auto result = textscrub::Diff(original, canonical, options);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_Diff_BudgetRefusal)->Range(1 << 10, 1 << 20);

}  // namespace

BENCHMARK_MAIN();
