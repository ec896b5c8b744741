#include <eonsim/io/demand_generation.hpp>

#include <stdexcept>

namespace eonsim::io {

std::vector<core::Demand> generate_demands(std::size_t node_count,
                                           const DemandGenerationParams& params,
                                           std::mt19937& rng) {
    if (node_count < 2) {
        throw std::invalid_argument("generate_demands: need at least two nodes");
    }
    if (params.min_bandwidth_gbps <= 0.0 ||
        params.max_bandwidth_gbps < params.min_bandwidth_gbps) {
        throw std::invalid_argument("generate_demands: invalid bandwidth range");
    }

    const auto last = static_cast<core::NodeId>(node_count - 1);
    std::uniform_int_distribution<core::NodeId> origin_dist(0, last);
    // One fewer choice: skip over the origin
    std::uniform_int_distribution<core::NodeId> destination_dist(0, last - 1);
    std::uniform_real_distribution<double> bandwidth_dist(params.min_bandwidth_gbps,
                                                          params.max_bandwidth_gbps);

    std::vector<core::Demand> demands;
    demands.reserve(params.count);
    for (std::size_t idx = 0; idx < params.count; ++idx) {
        core::Demand demand;
        demand.id = idx;
        demand.origin = origin_dist(rng);
        demand.destination = destination_dist(rng);
        if (demand.destination >= demand.origin) {
            ++demand.destination;
        }
        demand.bandwidth_gbps = bandwidth_dist(rng);
        demands.push_back(demand);
    }
    return demands;
}

std::vector<core::Demand> generate_demands(std::size_t node_count,
                                           const DemandGenerationParams& params, uint32_t seed) {
    std::mt19937 rng(seed);
    return generate_demands(node_count, params, rng);
}

} // namespace eonsim::io
