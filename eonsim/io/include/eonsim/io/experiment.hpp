#pragma once

/// @file experiment.hpp
/// @brief Load sweeps comparing two allocators over random demand sets.
/// @ingroup io_experiment

#include <eonsim/io/demand_generation.hpp>

#include <eonsim/core/config.hpp>
#include <eonsim/core/topology.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace eonsim::io {

/// @brief Parameters of a load sweep.
///
/// For every load and every run index `r` in `[0, runs)`, `load` demands are
/// generated with seed `r` and fed to both allocators on independent
/// ledgers.
///
/// @ingroup io_experiment
struct ExperimentParams {
    std::vector<std::size_t> loads{50, 100, 150, 200};
    std::size_t runs{5};
    std::string baseline{"spff"};
    std::string candidate{"adaptive"};
    double min_bandwidth_gbps{50.0};
    double max_bandwidth_gbps{400.0};
};

/// @brief Per-algorithm means over the runs of one load.
/// @ingroup io_experiment
struct AlgorithmAverages {
    double watermark{0.0};
    double blocking_probability{0.0};
    double utilization{0.0};
};

/// @brief Averages of both allocators at one load.
/// @ingroup io_experiment
struct LoadPoint {
    std::size_t load{0};
    AlgorithmAverages baseline;
    AlgorithmAverages candidate;

    /// @brief Baseline mean watermark minus candidate mean watermark.
    [[nodiscard]] double watermark_improvement() const noexcept;

    /// @brief Baseline mean blocking minus candidate mean blocking.
    [[nodiscard]] double blocking_improvement() const noexcept;
};

/// @brief Demands per slot of mean watermark (0 when the watermark is 0).
[[nodiscard]] double spectral_efficiency(std::size_t load, double mean_watermark) noexcept;

/// @brief Result of a full load sweep.
/// @ingroup io_experiment
struct ExperimentResult {
    ExperimentParams params;
    std::vector<LoadPoint> points;  ///< One entry per load, in sweep order.

    [[nodiscard]] double mean_watermark_improvement() const noexcept;
    [[nodiscard]] double mean_blocking_improvement() const noexcept;
};

/// @brief Callback invoked after each (load, run) pair completes.
using ExperimentProgress = std::function<void(std::size_t load, std::size_t run)>;

/// @brief Run a load sweep.
///
/// @param topology  Network graph.
/// @param config    Static configuration shared by both allocators.
/// @param params    Sweep parameters.
/// @param progress  Optional progress callback.
/// @return Averages per load.
/// @throws std::invalid_argument  If @p params has no loads, zero runs, or
///         names an unknown allocator.
ExperimentResult run_experiment(const core::Topology& topology, const core::EonConfig& config,
                                const ExperimentParams& params,
                                const ExperimentProgress& progress = {});

} // namespace eonsim::io
