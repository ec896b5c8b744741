#include <eonsim/algo/first_fit_allocator.hpp>

#include <utility>

namespace eonsim::algo {

AllocationOutcome FirstFitAllocator::allocate(const core::Demand& demand) {
    auto candidates = path_source().paths(demand.origin, demand.destination, 1);
    if (candidates.empty()) {
        return blocked(BlockReason::NoPath);
    }

    auto plan = plan_path(candidates.front(), demand.bandwidth_gbps);
    if (!plan) {
        return blocked(BlockReason::UnresolvedLink);
    }

    auto start = ledger().find_first_fit(plan->links, plan->slots);
    if (!start) {
        return blocked(BlockReason::NoSpectrum);
    }
    return commit(demand, std::move(*plan), *start);
}

} // namespace eonsim::algo
