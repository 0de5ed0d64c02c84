#include <benchmark/benchmark.h>
#include "seqscope/sequence.hpp"
#include "seqscope/composition.hpp"
#include "seqscope/codon_usage.hpp"
#include "seqscope/protein.hpp"
#include "seqscope/orf.hpp"
#include "seqscope/mutation.hpp"

#include <random>
#include <string>

using namespace seqscope;

// ============================================================================
// Helper Functions
// ============================================================================

static std::string generateRandomSequence(size_t length, unsigned seed = 42) {
    static const char bases[] = "ACGT";
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 3);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += bases[dist(rng)];
    }
    return result;
}

static std::string generateFastaText(size_t length) {
    auto bases = generateRandomSequence(length);
    std::string text = ">bench record\n";
    for (size_t i = 0; i < bases.length(); i += 60) {
        text += bases.substr(i, 60);
        text += '\n';
    }
    return text;
}

// ============================================================================
// Normalization Benchmarks
// ============================================================================

static void BM_Normalize(benchmark::State& state) {
    auto text = generateFastaText(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto seq = normalize(text, SequenceKind::RNA);
        benchmark::DoNotOptimize(seq);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Normalize)->Range(100, 100000);

static void BM_Validate(benchmark::State& state) {
    auto bases = generateRandomSequence(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto ok = validate(bases, SequenceKind::DNA);
        benchmark::DoNotOptimize(ok);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Validate)->Range(100, 100000);

// ============================================================================
// Analyzer Benchmarks
// ============================================================================

static void BM_Composition(benchmark::State& state) {
    auto bases = generateRandomSequence(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto result = composition(bases);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Composition)->Range(100, 100000);

static void BM_CodonUsage(benchmark::State& state) {
    auto bases = generateRandomSequence(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto result = codonUsage(bases);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CodonUsage)->Range(100, 100000);

static void BM_Translate(benchmark::State& state) {
    auto bases = generateRandomSequence(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto result = translate(bases, 0);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Translate)->Range(100, 100000);

static void BM_FindORFs(benchmark::State& state) {
    auto bases = generateRandomSequence(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto orfs = findORFs(bases);
        benchmark::DoNotOptimize(orfs);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_FindORFs)->Range(100, 100000);

static void BM_CompareMutations(benchmark::State& state) {
    auto reference = generateRandomSequence(static_cast<size_t>(state.range(0)), 42);
    auto query = generateRandomSequence(static_cast<size_t>(state.range(0)), 7);

    for (auto _ : state) {
        auto analysis = compareMutations(reference, query);
        benchmark::DoNotOptimize(analysis);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CompareMutations)->Range(100, 10000);

// ============================================================================
// Main
// ============================================================================

BENCHMARK_MAIN();
