/**
 * @file  bench/bench_transforms.cpp
 * @brief Google Benchmark suite for the representation and ensemble hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize_L2        — row-wise l2 normalization
 *   BM_ToFft               — centered DFT of every sample
 *   BM_ToAp                — amplitude / phase per time step
 *   BM_MakeRepresentations — IQ + FFT + AP together
 *   BM_Bag_Geometric / BM_Bag_Arithmetic
 *
 * Build (CMake):
 *   cmake --build build --target bench_transforms
 *   ./build/bench_transforms --benchmark_format=json
 *
 * Throughput units: items/second (signals processed).
 */

#include "benchmark/benchmark.h"

#include "rfmc/ensembler.hpp"
#include "rfmc/normalizer.hpp"
#include "rfmc/signal_repository.hpp"
#include "rfmc/synthetic.hpp"
#include "rfmc/transform.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N QPSK signals of length L, spread over three classes, l2-normalized.
static rfmc::SignalBatch make_batch(std::size_t n, std::size_t length) {
    rfmc::data::SyntheticConfig cfg;
    cfg.length            = length;
    cfg.signals_per_class = (n + 2) / 3;
    const auto sources = rfmc::data::SyntheticSource::generate(cfg);
    const auto dataset = rfmc::data::SignalRepository::load(sources);
    return rfmc::dsp::Normalizer{}.normalize(dataset.signals);
}

/// K row-stochastic (M, 3) matrices.
static std::vector<rfmc::ProbabilityMatrix> make_predictions(std::size_t k, std::size_t m) {
    std::vector<rfmc::ProbabilityMatrix> out;
    for (std::size_t i = 0; i < k; ++i) {
        rfmc::ProbabilityMatrix p =
            rfmc::ProbabilityMatrix::Random(static_cast<Eigen::Index>(m), 3).cwiseAbs();
        for (Eigen::Index r = 0; r < p.rows(); ++r) {
            p.row(r) /= p.row(r).sum();
        }
        out.push_back(std::move(p));
    }
    return out;
}

static void set_signal_rate(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

// ── DSP benchmarks ─────────────────────────────────────────────────────────────

static void BM_Normalize_L2(benchmark::State& state) {
    const auto batch = make_batch(300, static_cast<std::size_t>(state.range(0)));
    const rfmc::dsp::Normalizer norm;
    for (auto _ : state) {
        auto out = norm.normalize(batch);
        benchmark::DoNotOptimize(out.data().data());
        benchmark::ClobberMemory();
    }
    set_signal_rate(state, batch.size());
}
BENCHMARK(BM_Normalize_L2)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

static void BM_ToFft(benchmark::State& state) {
    const auto batch = make_batch(300, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto out = rfmc::dsp::to_fft(batch);
        benchmark::DoNotOptimize(out.data().data());
        benchmark::ClobberMemory();
    }
    set_signal_rate(state, batch.size());
}
BENCHMARK(BM_ToFft)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

static void BM_ToAp(benchmark::State& state) {
    const auto batch = make_batch(300, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto out = rfmc::dsp::to_ap(batch);
        benchmark::DoNotOptimize(out.data().data());
        benchmark::ClobberMemory();
    }
    set_signal_rate(state, batch.size());
}
BENCHMARK(BM_ToAp)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

static void BM_MakeRepresentations(benchmark::State& state) {
    const auto batch = make_batch(300, 1024);
    for (auto _ : state) {
        auto reps = rfmc::dsp::make_representations(batch);
        benchmark::DoNotOptimize(reps.ap.data().data());
        benchmark::ClobberMemory();
    }
    set_signal_rate(state, batch.size());
}
BENCHMARK(BM_MakeRepresentations)->Unit(benchmark::kMillisecond);

// ── Ensemble benchmarks ────────────────────────────────────────────────────────

static void BM_Bag_Geometric(benchmark::State& state) {
    const auto preds = make_predictions(3, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto out = rfmc::ensemble::Ensembler::geometric_mean(preds);
        benchmark::DoNotOptimize(out.data());
    }
    set_signal_rate(state, static_cast<std::size_t>(state.range(0)));
}
BENCHMARK(BM_Bag_Geometric)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

static void BM_Bag_Arithmetic(benchmark::State& state) {
    const auto preds = make_predictions(3, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto out = rfmc::ensemble::Ensembler::arithmetic_mean(preds);
        benchmark::DoNotOptimize(out.data());
    }
    set_signal_rate(state, static_cast<std::size_t>(state.range(0)));
}
BENCHMARK(BM_Bag_Arithmetic)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
