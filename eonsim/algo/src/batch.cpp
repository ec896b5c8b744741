#include <eonsim/algo/batch.hpp>

#include <eonsim/algo/adaptive_allocator.hpp>
#include <eonsim/algo/first_fit_allocator.hpp>
#include <eonsim/algo/min_watermark_allocator.hpp>

#include <stdexcept>
#include <string>

namespace eonsim::algo {

std::vector<std::string_view> allocator_names() {
    return {"spff", "ksp-mw", "adaptive"};
}

std::unique_ptr<Allocator> make_allocator(std::string_view name, core::SpectrumLedger& ledger,
                                          const core::Topology& topology, PathSource& paths,
                                          const core::EonConfig& config) {
    if (name == "spff") {
        return std::make_unique<FirstFitAllocator>(ledger, topology, paths, config);
    }
    if (name == "ksp-mw") {
        return std::make_unique<MinWatermarkAllocator>(ledger, topology, paths, config);
    }
    if (name == "adaptive") {
        return std::make_unique<AdaptiveAllocator>(ledger, topology, paths, config);
    }
    throw std::invalid_argument("Unknown algorithm: " + std::string(name));
}

BatchResult run_batch(std::string_view name, const core::Topology& topology,
                      std::span<const core::Demand> demands, const core::EonConfig& config,
                      core::TraceWriter* trace) {
    core::SpectrumLedger ledger(topology, config);
    KShortestPathSource paths(topology);
    auto allocator = make_allocator(name, ledger, topology, paths, config);

    DemandScheduler scheduler(*allocator);
    scheduler.set_trace_writer(trace);
    return scheduler.run(demands);
}

double Comparison::watermark_improvement() const noexcept {
    return static_cast<double>(baseline.watermark) - static_cast<double>(adaptive.watermark);
}

double Comparison::blocking_improvement() const noexcept {
    return baseline.blocking_probability - adaptive.blocking_probability;
}

Comparison compare_algorithms(const core::Topology& topology,
                              std::span<const core::Demand> demands,
                              const core::EonConfig& config) {
    Comparison comparison;
    comparison.baseline = run_batch("spff", topology, demands, config);
    comparison.adaptive = run_batch("adaptive", topology, demands, config);
    return comparison;
}

} // namespace eonsim::algo
