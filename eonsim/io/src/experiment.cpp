#include <eonsim/io/experiment.hpp>

#include <eonsim/algo/batch.hpp>

#include <algorithm>
#include <stdexcept>

namespace eonsim::io {

namespace {

void require_known(const std::string& name) {
    auto names = algo::allocator_names();
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        throw std::invalid_argument("Unknown algorithm: " + name);
    }
}

void accumulate(AlgorithmAverages& sum, const algo::BatchResult& result) {
    sum.watermark += static_cast<double>(result.watermark);
    sum.blocking_probability += result.blocking_probability;
    sum.utilization += result.utilization;
}

void divide(AlgorithmAverages& sum, std::size_t runs) {
    auto n = static_cast<double>(runs);
    sum.watermark /= n;
    sum.blocking_probability /= n;
    sum.utilization /= n;
}

} // anonymous namespace

double LoadPoint::watermark_improvement() const noexcept {
    return baseline.watermark - candidate.watermark;
}

double LoadPoint::blocking_improvement() const noexcept {
    return baseline.blocking_probability - candidate.blocking_probability;
}

double spectral_efficiency(std::size_t load, double mean_watermark) noexcept {
    return mean_watermark > 0.0 ? static_cast<double>(load) / mean_watermark : 0.0;
}

double ExperimentResult::mean_watermark_improvement() const noexcept {
    if (points.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& point : points) {
        total += point.watermark_improvement();
    }
    return total / static_cast<double>(points.size());
}

double ExperimentResult::mean_blocking_improvement() const noexcept {
    if (points.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& point : points) {
        total += point.blocking_improvement();
    }
    return total / static_cast<double>(points.size());
}

ExperimentResult run_experiment(const core::Topology& topology, const core::EonConfig& config,
                                const ExperimentParams& params,
                                const ExperimentProgress& progress) {
    if (params.loads.empty()) {
        throw std::invalid_argument("run_experiment: no demand loads");
    }
    if (params.runs == 0) {
        throw std::invalid_argument("run_experiment: runs must be positive");
    }
    require_known(params.baseline);
    require_known(params.candidate);

    ExperimentResult result;
    result.params = params;

    DemandGenerationParams generation;
    generation.min_bandwidth_gbps = params.min_bandwidth_gbps;
    generation.max_bandwidth_gbps = params.max_bandwidth_gbps;

    for (auto load : params.loads) {
        LoadPoint point;
        point.load = load;
        generation.count = load;

        for (std::size_t run = 0; run < params.runs; ++run) {
            auto demands = generate_demands(topology.node_count(), generation,
                                            static_cast<uint32_t>(run));
            accumulate(point.baseline, algo::run_batch(params.baseline, topology, demands, config));
            accumulate(point.candidate,
                       algo::run_batch(params.candidate, topology, demands, config));
            if (progress) {
                progress(load, run);
            }
        }

        divide(point.baseline, params.runs);
        divide(point.candidate, params.runs);
        result.points.push_back(point);
    }
    return result;
}

} // namespace eonsim::io
