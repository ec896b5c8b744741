#pragma once

#include <eonsim/algo/allocator.hpp>

namespace eonsim::algo {

/// @brief Shortest-Path First-Fit (SPFF) allocator.
///
/// Routes every demand over the single least-distance path and places it at
/// the lowest window that is free on all of the path's links. There is no
/// retry on an alternate path: if the shortest path has no room the demand
/// is blocked.
///
/// This is the baseline the other strategies are compared against.
///
/// @ingroup algo_allocators
/// @see Allocator, core::SpectrumLedger::find_first_fit
class FirstFitAllocator : public Allocator {
public:
    /// @cond INTERNAL
    using Allocator::Allocator;
    /// @endcond

    AllocationOutcome allocate(const core::Demand& demand) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "spff"; }
};

} // namespace eonsim::algo
