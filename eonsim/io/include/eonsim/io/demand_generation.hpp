#pragma once

/// @file demand_generation.hpp
/// @brief Seeded random demand generation.
/// @ingroup io_generation

#include <eonsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace eonsim::io {

/// @brief Parameters of the uniform demand generator.
///
/// @ingroup io_generation
struct DemandGenerationParams {
    std::size_t count{100};              ///< Number of demands.
    double min_bandwidth_gbps{50.0};     ///< Lower bound of the bandwidth draw.
    double max_bandwidth_gbps{400.0};    ///< Upper bound of the bandwidth draw.
};

/// @brief Draw demands between distinct uniformly chosen nodes.
///
/// Origin is uniform over all nodes, destination uniform over the others,
/// bandwidth uniform in `[min_bandwidth_gbps, max_bandwidth_gbps]`. Ids are
/// assigned 0, 1, ... in generation order.
///
/// @param node_count  Number of nodes in the topology.
/// @param params      Generator parameters.
/// @param rng         Random source.
/// @return @c params.count demands.
/// @throws std::invalid_argument  If @p node_count is below 2 or the
///         bandwidth bounds are not positive and ordered.
std::vector<core::Demand> generate_demands(std::size_t node_count,
                                           const DemandGenerationParams& params,
                                           std::mt19937& rng);

/// @brief Convenience overload seeding a fresh generator.
///
/// The same seed always produces the same sequence.
std::vector<core::Demand> generate_demands(std::size_t node_count,
                                           const DemandGenerationParams& params, uint32_t seed);

} // namespace eonsim::io
