#include <eonsim/algo/adaptive_allocator.hpp>

#include <algorithm>
#include <tuple>
#include <utility>
#include <vector>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace eonsim::algo {

PlacementScore score_placement(const core::SpectrumLedger& ledger,
                               std::span<const core::LinkIndex> links, std::size_t start,
                               std::size_t slots, double path_length_km) noexcept {
    const std::size_t end = start + slots;
    std::size_t current = 0;
    double total = 0.0;
    for (auto link : links) {
        std::size_t watermark = ledger.link_watermark(link);
        current = std::max(current, watermark);
        total += static_cast<double>(std::max(watermark, end));
    }

    PlacementScore score;
    score.resulting = std::max(current, end);
    score.increase = score.resulting - current;
    score.path_length_km = path_length_km;
    score.offset = start;
    score.average_link_watermark = links.empty() ? 0.0 : total / static_cast<double>(links.size());
    return score;
}

bool better_candidate(LoadMode mode, const PlacementScore& candidate,
                      const PlacementScore& incumbent) noexcept {
    switch (mode) {
    case LoadMode::Normal:
        return std::tie(candidate.increase, candidate.resulting, candidate.path_length_km,
                        candidate.offset, candidate.average_link_watermark) <
               std::tie(incumbent.increase, incumbent.resulting, incumbent.path_length_km,
                        incumbent.offset, incumbent.average_link_watermark);
    case LoadMode::High:
        return std::tie(candidate.path_length_km, candidate.offset, candidate.increase,
                        candidate.resulting) <
               std::tie(incumbent.path_length_km, incumbent.offset, incumbent.increase,
                        incumbent.resulting);
    case LoadMode::Extreme:
        break;
    }
    return false;
}

AllocationOutcome AdaptiveAllocator::allocate(const core::Demand& demand) {
    const auto mode = select_load_mode(ledger().watermark_ratio(), ledger().utilization(),
                                       config().thresholds);
    last_mode_ = mode;

    auto outcome = place(demand, mode);
    outcome.mode = mode;
    return outcome;
}

AllocationOutcome AdaptiveAllocator::place(const core::Demand& demand, LoadMode mode) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif

    const auto params = mode_parameters(mode, config());
    auto candidates = path_source().paths(demand.origin, demand.destination, params.k_paths);
    if (candidates.empty()) {
        return blocked(BlockReason::NoPath);
    }

    std::vector<PathPlan> plans;
    plans.reserve(candidates.size());

    std::optional<std::size_t> best_plan;
    PlacementScore best_score;

    for (const auto& path : candidates) {
        auto plan = plan_path(path, demand.bandwidth_gbps);
        if (!plan) {
            continue;
        }

        if (mode == LoadMode::Extreme) {
            if (auto start = ledger().find_first_fit(plan->links, plan->slots)) {
                return commit(demand, std::move(*plan), *start);
            }
            plans.push_back(std::move(*plan));
            continue;
        }

        auto offsets = ledger().find_best_fit_positions(plan->links, plan->slots,
                                                        params.max_offsets);
        for (auto offset : offsets) {
            auto score = score_placement(ledger(), plan->links, offset, plan->slots,
                                         plan->path.distance_km);
            if (!best_plan || better_candidate(mode, score, best_score)) {
                best_plan = plans.size();
                best_score = score;
            }
        }
        plans.push_back(std::move(*plan));
    }

    if (!best_plan) {
        return blocked(plans.empty() ? BlockReason::UnresolvedLink : BlockReason::NoSpectrum);
    }
    return commit(demand, std::move(plans[*best_plan]), best_score.offset);
}

} // namespace eonsim::algo
