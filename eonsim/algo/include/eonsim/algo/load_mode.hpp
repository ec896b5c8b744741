#pragma once

/// @file load_mode.hpp
/// @brief Network load regimes of the adaptive allocator.
/// @ingroup algo_allocators

#include <eonsim/core/config.hpp>

#include <cstddef>
#include <string_view>

namespace eonsim::algo {

/// @brief Load regime derived from the current ledger state.
///
/// The adaptive allocator re-evaluates the mode before every demand. Higher
/// modes trade placement quality for search breadth and cost.
///
/// @see select_load_mode, AdaptiveAllocator
enum class LoadMode {
    Normal,   ///< Minimise the resulting watermark over up to 10 best-fit offsets.
    High,     ///< Prefer short paths and low offsets over up to 3 best-fit offsets.
    Extreme   ///< Commit the first viable first-fit candidate.
};

/// @brief Search parameters of one load mode.
struct ModeParameters {
    std::size_t k_paths;      ///< Candidate paths requested from the PathSource.
    std::size_t max_offsets;  ///< Candidate offsets examined per path.
};

/// @brief Classify the load of the network.
///
/// Extreme is checked first, then High; each is entered when either its
/// watermark-ratio or its utilization threshold is strictly exceeded.
///
/// @param watermark_ratio  Watermark divided by slot capacity.
/// @param utilization      Fraction of occupied cells.
/// @param thresholds       Mode boundaries.
/// @return The first matching mode, Normal if none matches.
[[nodiscard]] LoadMode select_load_mode(double watermark_ratio, double utilization,
                                        const core::LoadThresholds& thresholds) noexcept;

/// @brief Search parameters for a mode under a configuration.
[[nodiscard]] ModeParameters mode_parameters(LoadMode mode, const core::EonConfig& config) noexcept;

/// @brief Lower-case name of a mode ("normal", "high", "extreme").
[[nodiscard]] std::string_view to_string(LoadMode mode) noexcept;

} // namespace eonsim::algo
