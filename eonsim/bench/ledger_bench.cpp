#include <eonsim/core/config.hpp>
#include <eonsim/core/spectrum_ledger.hpp>
#include <eonsim/core/topology.hpp>

#include <eonsim/algo/batch.hpp>
#include <eonsim/algo/k_shortest_paths.hpp>

#include <eonsim/io/demand_generation.hpp>
#include <eonsim/io/topology_loader.hpp>

#include <benchmark/benchmark.h>

#include <random>
#include <vector>

using namespace eonsim::core;
using namespace eonsim::algo;

namespace {

// Fill a ledger with random 4-slot blocks until roughly @p fill of the cells are used
SpectrumLedger fragmented_ledger(std::size_t links, std::size_t capacity, double fill) {
    SpectrumLedger ledger(links, capacity);
    std::mt19937 rng(7);
    std::uniform_int_distribution<std::size_t> link_dist(0, links - 1);
    std::uniform_int_distribution<std::size_t> start_dist(0, capacity - 4);

    auto target = static_cast<std::size_t>(fill * static_cast<double>(links * capacity));
    while (ledger.occupied_cells() < target) {
        std::vector<LinkIndex> one{link_dist(rng)};
        // Overlapping draws are rejected and simply redrawn
        (void)ledger.commit(one, start_dist(rng), 4);
    }
    return ledger;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BM_FirstFit: first-fit over a 4-link path on a fragmented ledger
// ---------------------------------------------------------------------------

static void BM_FirstFit(benchmark::State& state) {
    auto ledger = fragmented_ledger(23, 320, static_cast<double>(state.range(0)) / 100.0);
    const std::vector<LinkIndex> path{0, 5, 11, 17};

    for (auto _ : state) {
        auto start = ledger.find_first_fit(path, 8);
        benchmark::DoNotOptimize(start);
    }
}
BENCHMARK(BM_FirstFit)->Arg(10)->Arg(40)->Arg(70);

// ---------------------------------------------------------------------------
// BM_BestFitPositions: ranked offsets, Normal-mode cap
// ---------------------------------------------------------------------------

static void BM_BestFitPositions(benchmark::State& state) {
    auto ledger = fragmented_ledger(23, 320, static_cast<double>(state.range(0)) / 100.0);
    const std::vector<LinkIndex> path{0, 5, 11, 17};

    for (auto _ : state) {
        auto offsets = ledger.find_best_fit_positions(path, 8, 10);
        benchmark::DoNotOptimize(offsets);
    }
}
BENCHMARK(BM_BestFitPositions)->Arg(10)->Arg(40)->Arg(70);

// ---------------------------------------------------------------------------
// BM_KShortestPaths: Yen on NSFNET between the farthest corners
// ---------------------------------------------------------------------------

static void BM_KShortestPaths(benchmark::State& state) {
    auto topology = eonsim::io::nsfnet_topology();
    const auto k = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        auto paths = k_shortest_paths(topology, 0, 13, k);
        benchmark::DoNotOptimize(paths);
    }
}
BENCHMARK(BM_KShortestPaths)->Arg(3)->Arg(5);

// ---------------------------------------------------------------------------
// BM_Batch: full batch on NSFNET, one allocator per benchmark
// ---------------------------------------------------------------------------

static void BM_Batch(benchmark::State& state, const char* algorithm) {
    auto topology = eonsim::io::nsfnet_topology();
    auto config = default_config();
    eonsim::io::DemandGenerationParams params;
    params.count = static_cast<std::size_t>(state.range(0));
    auto demands = eonsim::io::generate_demands(topology.node_count(), params, 1U);

    for (auto _ : state) {
        auto result = run_batch(algorithm, topology, demands, config);
        benchmark::DoNotOptimize(result.watermark);
    }
}
BENCHMARK_CAPTURE(BM_Batch, spff, "spff")->Arg(100)->Arg(200);
BENCHMARK_CAPTURE(BM_Batch, ksp_mw, "ksp-mw")->Arg(100)->Arg(200);
BENCHMARK_CAPTURE(BM_Batch, adaptive, "adaptive")->Arg(100)->Arg(200);
