#include <eonsim/algo/allocator.hpp>

#include <eonsim/core/error.hpp>

#include <utility>

namespace eonsim::algo {

namespace {

const core::EonConfig& validated(const core::EonConfig& config) {
    core::validate(config);
    return config;
}

} // anonymous namespace

std::string_view to_string(BlockReason reason) noexcept {
    switch (reason) {
    case BlockReason::None:           return "none";
    case BlockReason::NoPath:         return "no_path";
    case BlockReason::UnresolvedLink: return "unresolved_link";
    case BlockReason::NoSpectrum:     return "no_spectrum";
    case BlockReason::CommitConflict: return "commit_conflict";
    }
    return "unknown";
}

Allocator::Allocator(core::SpectrumLedger& ledger, const core::Topology& topology,
                     PathSource& paths, const core::EonConfig& config)
    : ledger_(ledger)
    , topology_(topology)
    , paths_(paths)
    , config_(validated(config))
    , modulations_(core::ModulationTable::from_config(config_)) {
    if (ledger_.link_count() != topology_.link_count()) {
        throw core::ConfigError("ledger has " + std::to_string(ledger_.link_count()) +
                                " links but topology has " +
                                std::to_string(topology_.link_count()));
    }
}

std::optional<Allocator::PathPlan> Allocator::plan_path(const core::Path& path,
                                                        double bandwidth_gbps) const {
    auto links = topology_.resolve_links(path.nodes);
    if (!links) {
        return std::nullopt;
    }
    const auto& modulation = modulations_.select_modulation(path.distance_km);
    return PathPlan{path, std::move(*links), &modulation,
                    modulations_.required_slots(bandwidth_gbps, modulation)};
}

AllocationOutcome Allocator::commit(const core::Demand& demand, PathPlan plan, std::size_t start) {
    if (!ledger_.commit(plan.links, start, plan.slots)) {
        return blocked(BlockReason::CommitConflict);
    }
    AllocationOutcome outcome;
    outcome.circuit = Circuit{demand.id,        std::move(plan.path), std::move(plan.links),
                              start,            plan.slots,           plan.modulation->name};
    return outcome;
}

AllocationOutcome Allocator::blocked(BlockReason reason) {
    AllocationOutcome outcome;
    outcome.block_reason = reason;
    return outcome;
}

} // namespace eonsim::algo
