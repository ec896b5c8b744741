#pragma once

/// @file topology.hpp
/// @brief Undirected weighted network graph with stable link indices.
/// @ingroup core_topology

#include <eonsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace eonsim::core {

/// @brief An undirected fibre link between two nodes.
/// @ingroup core_topology
struct Link {
    NodeId source{0};        ///< Endpoint given first at insertion.
    NodeId target{0};        ///< Endpoint given second at insertion.
    double distance_km{0.0}; ///< Fibre length (km).
};

/// @brief Neighbour entry of the adjacency list.
/// @ingroup core_topology
struct Adjacency {
    NodeId node;      ///< Neighbouring node.
    LinkIndex link;   ///< Link reaching it.
};

/// @brief Undirected network graph.
///
/// Nodes are dense identifiers `0..node_count()-1`. Links receive indices
/// in insertion order; that order is the row order of the SpectrumLedger and
/// never changes once a link is added. A link can be looked up from either
/// endpoint order.
///
/// @ingroup core_topology
/// @see SpectrumLedger, io::load_topology, io::nsfnet_topology
class Topology {
public:
    Topology() = default;

    /// @brief Create a topology with @p node_count isolated nodes.
    /// @param node_count  Number of nodes.
    explicit Topology(std::size_t node_count);

    /// @brief Append a node.
    /// @return Identifier of the new node.
    NodeId add_node();

    /// @brief Add an undirected link.
    ///
    /// @param a            First endpoint.
    /// @param b            Second endpoint.
    /// @param distance_km  Fibre length, must be positive.
    /// @return Index of the new link (equal to the previous link count).
    /// @throws TopologyError  If an endpoint is unknown, @p a equals @p b,
    ///         the pair is already linked, or the distance is not positive.
    LinkIndex add_link(NodeId a, NodeId b, double distance_km);

    [[nodiscard]] std::size_t node_count() const noexcept { return adjacency_.size(); }
    [[nodiscard]] std::size_t link_count() const noexcept { return links_.size(); }

    /// @brief Access a link by index.
    /// @param index  Link index.
    /// @return The link.
    /// @throws TopologyError  If @p index is out of range.
    [[nodiscard]] const Link& link(LinkIndex index) const;

    [[nodiscard]] std::span<const Link> links() const noexcept { return links_; }

    /// @brief Neighbours of a node, in link insertion order.
    /// @param node  Node identifier.
    /// @return Empty span for an unknown node.
    [[nodiscard]] std::span<const Adjacency> neighbors(NodeId node) const noexcept;

    /// @brief Find the link joining two nodes, in either direction.
    /// @return The link index, or @c std::nullopt if the nodes are not adjacent.
    [[nodiscard]] std::optional<LinkIndex> link_index(NodeId a, NodeId b) const noexcept;

    /// @brief Map a node sequence to the indices of the links it traverses.
    ///
    /// @param nodes  Path as a node sequence.
    /// @return One link index per hop, or @c std::nullopt if some consecutive
    ///         pair is not adjacent or the sequence has fewer than two nodes.
    [[nodiscard]] std::optional<std::vector<LinkIndex>>
    resolve_links(std::span<const NodeId> nodes) const;

    /// @brief Sum the link distances along a node sequence.
    /// @param nodes  Path as a node sequence.
    /// @return Total distance, 0 for fewer than two nodes, or
    ///         @c std::nullopt if some consecutive pair is not adjacent.
    [[nodiscard]] std::optional<double> path_distance(std::span<const NodeId> nodes) const noexcept;

    /// @brief Whether every node is reachable from node 0.
    /// @return @c true for an empty topology.
    [[nodiscard]] bool is_connected() const;

private:
    static uint64_t pair_key(NodeId a, NodeId b) noexcept;

    std::vector<Link> links_;
    std::vector<std::vector<Adjacency>> adjacency_;
    std::unordered_map<uint64_t, LinkIndex> link_lookup_;
};

/// @brief Summary figures of a topology.
/// @ingroup core_topology
struct TopologyStats {
    std::size_t nodes{0};
    std::size_t links{0};
    double density{0.0};          ///< links / (nodes * (nodes - 1) / 2).
    double average_degree{0.0};
    bool connected{false};
    double min_distance_km{0.0};
    double max_distance_km{0.0};
    double total_distance_km{0.0};
};

/// @brief Compute summary figures for a topology.
/// @param topology  Graph to describe.
/// @return Populated TopologyStats (distances are 0 for a link-less graph).
TopologyStats topology_stats(const Topology& topology);

} // namespace eonsim::core
