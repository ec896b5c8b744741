#include <eonsim/algo/min_watermark_allocator.hpp>

#include <algorithm>
#include <utility>

namespace eonsim::algo {

AllocationOutcome MinWatermarkAllocator::allocate(const core::Demand& demand) {
    auto candidates = path_source().paths(demand.origin, demand.destination, config().k_paths);
    if (candidates.empty()) {
        return blocked(BlockReason::NoPath);
    }

    std::optional<PathPlan> best;
    std::size_t best_start = 0;
    std::size_t best_watermark = 0;
    bool resolved_any = false;

    for (const auto& path : candidates) {
        auto plan = plan_path(path, demand.bandwidth_gbps);
        if (!plan) {
            continue;
        }
        resolved_any = true;

        auto start = ledger().find_first_fit(plan->links, plan->slots);
        if (!start) {
            continue;
        }
        std::size_t simulated = std::max(ledger().watermark(), *start + plan->slots);
        if (!best || simulated < best_watermark) {
            best = std::move(plan);
            best_start = *start;
            best_watermark = simulated;
        }
    }

    if (!best) {
        return blocked(resolved_any ? BlockReason::NoSpectrum : BlockReason::UnresolvedLink);
    }
    return commit(demand, std::move(*best), best_start);
}

} // namespace eonsim::algo
