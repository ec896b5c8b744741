#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace eonsim::core {

/// @brief Identifier of a network node (0-based, dense).
/// @ingroup core_types
using NodeId = uint32_t;

/// @brief Index of an undirected link in `[0, Topology::link_count())`.
///
/// Link indices are assigned in insertion order when the topology is built
/// and are the row indices of the SpectrumLedger occupancy grid.
///
/// @see Topology::add_link, SpectrumLedger
/// @ingroup core_types
using LinkIndex = std::size_t;

/// @brief A bandwidth request between two nodes.
///
/// Demands are consumed exactly once by the DemandScheduler. The @c id is
/// the position of the demand in the input sequence; it survives the
/// bandwidth sort and identifies the demand in traces and circuit records.
///
/// @ingroup core_types
struct Demand {
    uint64_t id{0};               ///< Position in the original demand sequence.
    NodeId origin{0};             ///< Source node.
    NodeId destination{0};        ///< Destination node.
    double bandwidth_gbps{0.0};   ///< Requested line rate (Gb/s).
};

/// @brief A loop-free route through the topology.
///
/// @c nodes lists the traversed nodes from origin to destination.
/// @c distance_km is the sum of the link distances along the route.
///
/// @ingroup core_types
struct Path {
    std::vector<NodeId> nodes;    ///< Traversed nodes, origin first.
    double distance_km{0.0};      ///< Total route length (km).

    /// @brief Number of links traversed.
    /// @return `nodes.size() - 1`, or 0 for an empty or single-node path.
    [[nodiscard]] std::size_t hop_count() const noexcept {
        return nodes.size() < 2 ? 0 : nodes.size() - 1;
    }

    bool operator==(const Path& rhs) const = default;
};

} // namespace eonsim::core
