#pragma once

#include <eonsim/algo/allocator.hpp>

namespace eonsim::algo {

/// @brief k-shortest-paths allocator minimising the global watermark.
///
/// For each of the EonConfig::k_paths shortest paths, takes the first-fit
/// window and computes the network watermark that committing it would
/// produce, `max(watermark, start + slots)`. The path with the strictly
/// smallest value is committed; on a tie the shorter path wins.
///
/// Unlike AdaptiveAllocator it does not look at per-link watermarks or
/// adapt to load.
///
/// @ingroup algo_allocators
/// @see Allocator, AdaptiveAllocator
class MinWatermarkAllocator : public Allocator {
public:
    /// @cond INTERNAL
    using Allocator::Allocator;
    /// @endcond

    AllocationOutcome allocate(const core::Demand& demand) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "ksp-mw"; }
};

} // namespace eonsim::algo
