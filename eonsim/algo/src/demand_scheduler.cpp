#include <eonsim/algo/demand_scheduler.hpp>

#include <algorithm>
#include <optional>
#include <utility>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace eonsim::algo {

double BatchResult::success_rate() const noexcept {
    return total == 0 ? 0.0 : static_cast<double>(successful) / static_cast<double>(total);
}

double BatchResult::spectral_efficiency() const noexcept {
    return watermark == 0 ? 0.0 : static_cast<double>(successful) / static_cast<double>(watermark);
}

std::vector<core::Demand> sort_by_bandwidth(std::span<const core::Demand> demands) {
    std::vector<core::Demand> sorted(demands.begin(), demands.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const core::Demand& a, const core::Demand& b) {
                         return a.bandwidth_gbps > b.bandwidth_gbps;
                     });
    return sorted;
}

double blocking_probability(std::size_t blocked, std::size_t total) noexcept {
    return total == 0 ? 0.0 : static_cast<double>(blocked) / static_cast<double>(total);
}

DemandScheduler::DemandScheduler(Allocator& allocator)
    : allocator_(allocator) {}

BatchResult DemandScheduler::run(std::span<const core::Demand> demands) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif

    BatchResult result;
    result.algorithm = std::string(allocator_.name());

    const auto sorted = sort_by_bandwidth(demands);
    std::optional<LoadMode> previous_mode;
    uint64_t step = 0;

    for (const auto& demand : sorted) {
        // Load seen by the allocator when it classifies this demand
        const auto watermark_before = static_cast<uint64_t>(allocator_.ledger().watermark());
        const double utilization_before = allocator_.ledger().utilization();

        auto outcome = allocator_.allocate(demand);
        ++result.total;

        if (outcome.mode) {
            ++result.demands_by_mode[*outcome.mode];
            if (previous_mode && *previous_mode != *outcome.mode) {
                trace(step, [&](core::TraceWriter& w) {
                    w.type("mode_change");
                    w.field("from", to_string(*previous_mode));
                    w.field("to", to_string(*outcome.mode));
                    w.field("watermark", watermark_before);
                    w.field("utilization", utilization_before);
                });
            }
            previous_mode = outcome.mode;
        }

        if (outcome.allocated()) {
            ++result.successful;
            const auto& circuit = *outcome.circuit;
            trace(step, [&](core::TraceWriter& w) {
                w.type("demand_allocated");
                w.field("demand_id", circuit.demand_id);
                w.field("origin", static_cast<uint64_t>(demand.origin));
                w.field("destination", static_cast<uint64_t>(demand.destination));
                w.field("bandwidth_gbps", demand.bandwidth_gbps);
                w.field("hops", static_cast<uint64_t>(circuit.path.hop_count()));
                w.field("distance_km", circuit.path.distance_km);
                w.field("modulation", circuit.modulation);
                w.field("start_slot", static_cast<uint64_t>(circuit.start_slot));
                w.field("slot_count", static_cast<uint64_t>(circuit.slot_count));
                w.field("watermark", static_cast<uint64_t>(allocator_.ledger().watermark()));
            });
            result.circuits.push_back(std::move(*outcome.circuit));
        } else {
            ++result.blocked;
            ++result.blocked_by_reason[outcome.block_reason];
            trace(step, [&](core::TraceWriter& w) {
                w.type("demand_blocked");
                w.field("demand_id", demand.id);
                w.field("origin", static_cast<uint64_t>(demand.origin));
                w.field("destination", static_cast<uint64_t>(demand.destination));
                w.field("bandwidth_gbps", demand.bandwidth_gbps);
                w.field("reason", to_string(outcome.block_reason));
            });
        }
        ++step;
    }

    result.watermark = allocator_.ledger().watermark();
    result.utilization = allocator_.ledger().utilization();
    result.blocking_probability = blocking_probability(result.blocked, result.total);

    trace(step, [&](core::TraceWriter& w) {
        w.type("batch_complete");
        w.field("algorithm", result.algorithm);
        w.field("total", static_cast<uint64_t>(result.total));
        w.field("successful", static_cast<uint64_t>(result.successful));
        w.field("blocked", static_cast<uint64_t>(result.blocked));
        w.field("watermark", static_cast<uint64_t>(result.watermark));
        w.field("utilization", result.utilization);
        w.field("blocking_probability", result.blocking_probability);
    });

    return result;
}

} // namespace eonsim::algo
