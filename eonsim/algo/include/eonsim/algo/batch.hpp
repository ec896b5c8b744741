#pragma once

/// @file batch.hpp
/// @brief Allocator factory and single-batch runners.
/// @ingroup algo_scheduler

#include <eonsim/algo/allocator.hpp>
#include <eonsim/algo/demand_scheduler.hpp>
#include <eonsim/algo/path_source.hpp>

#include <eonsim/core/config.hpp>
#include <eonsim/core/spectrum_ledger.hpp>
#include <eonsim/core/topology.hpp>
#include <eonsim/core/trace_writer.hpp>
#include <eonsim/core/types.hpp>

#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace eonsim::algo {

/// @brief Names accepted by make_allocator(), in display order.
[[nodiscard]] std::vector<std::string_view> allocator_names();

/// @brief Create an allocator by name.
///
/// | Name       | Allocator             |
/// |------------|-----------------------|
/// | `spff`     | FirstFitAllocator     |
/// | `ksp-mw`   | MinWatermarkAllocator |
/// | `adaptive` | AdaptiveAllocator     |
///
/// @throws std::invalid_argument  If @p name is not one of the above.
/// @throws core::ConfigError      If @p config is invalid.
[[nodiscard]] std::unique_ptr<Allocator> make_allocator(std::string_view name,
                                                        core::SpectrumLedger& ledger,
                                                        const core::Topology& topology,
                                                        PathSource& paths,
                                                        const core::EonConfig& config);

/// @brief Run one batch on a fresh ledger.
///
/// Builds a new SpectrumLedger, KShortestPathSource and allocator, then
/// processes @p demands through a DemandScheduler.
///
/// @param name      Allocator name (see make_allocator()).
/// @param topology  Network graph.
/// @param demands   Demands in input order.
/// @param config    Static configuration.
/// @param trace     Optional trace writer.
/// @return The batch result.
[[nodiscard]] BatchResult run_batch(std::string_view name, const core::Topology& topology,
                                    std::span<const core::Demand> demands,
                                    const core::EonConfig& config,
                                    core::TraceWriter* trace = nullptr);

/// @brief Head-to-head result of the baseline and the adaptive allocator.
struct Comparison {
    BatchResult baseline;  ///< SPFF result.
    BatchResult adaptive;  ///< AdaptiveAllocator result.

    /// @brief Baseline watermark minus adaptive watermark (positive is better).
    [[nodiscard]] double watermark_improvement() const noexcept;

    /// @brief Baseline blocking probability minus adaptive blocking probability.
    [[nodiscard]] double blocking_improvement() const noexcept;
};

/// @brief Run SPFF and the adaptive allocator on independent ledgers.
[[nodiscard]] Comparison compare_algorithms(const core::Topology& topology,
                                            std::span<const core::Demand> demands,
                                            const core::EonConfig& config);

} // namespace eonsim::algo
