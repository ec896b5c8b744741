#pragma once

/// @file k_shortest_paths.hpp
/// @brief Distance-weighted path ranking over a Topology.
/// @ingroup algo_paths

#include <eonsim/core/topology.hpp>
#include <eonsim/core/types.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace eonsim::algo {

/// @brief Least-distance path between two nodes (Dijkstra).
///
/// Ties between equal-distance routes are broken deterministically by the
/// order in which nodes are settled.
///
/// @param topology     Graph to search.
/// @param origin       Source node.
/// @param destination  Destination node.
/// @return The shortest path, or @c std::nullopt if the nodes are
///         disconnected, unknown, or equal.
std::optional<core::Path> shortest_path(const core::Topology& topology, core::NodeId origin,
                                        core::NodeId destination);

/// @brief Up to @p k loop-free paths in ascending distance (Yen's algorithm).
///
/// @param topology     Graph to search.
/// @param origin       Source node.
/// @param destination  Destination node.
/// @param k            Maximum number of paths.
/// @return Paths ordered by (distance, node sequence); empty if the nodes are
///         disconnected, unknown, or equal, or if @p k is 0.
std::vector<core::Path> k_shortest_paths(const core::Topology& topology, core::NodeId origin,
                                         core::NodeId destination, std::size_t k);

} // namespace eonsim::algo
