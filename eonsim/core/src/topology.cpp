#include <eonsim/core/topology.hpp>
#include <eonsim/core/error.hpp>

#include <algorithm>
#include <string>

namespace eonsim::core {

Topology::Topology(std::size_t node_count)
    : adjacency_(node_count) {}

NodeId Topology::add_node() {
    adjacency_.emplace_back();
    return static_cast<NodeId>(adjacency_.size() - 1);
}

LinkIndex Topology::add_link(NodeId a, NodeId b, double distance_km) {
    if (a >= node_count() || b >= node_count()) {
        throw TopologyError("link " + std::to_string(a) + "-" + std::to_string(b) +
                            " references an unknown node");
    }
    if (a == b) {
        throw TopologyError("self-loop on node " + std::to_string(a));
    }
    if (!(distance_km > 0.0)) {
        throw TopologyError("link " + std::to_string(a) + "-" + std::to_string(b) +
                            " must have a positive distance");
    }

    LinkIndex index = links_.size();
    if (!link_lookup_.emplace(pair_key(a, b), index).second) {
        throw TopologyError("duplicate link " + std::to_string(a) + "-" + std::to_string(b));
    }

    links_.push_back(Link{a, b, distance_km});
    adjacency_[a].push_back(Adjacency{b, index});
    adjacency_[b].push_back(Adjacency{a, index});
    return index;
}

const Link& Topology::link(LinkIndex index) const {
    if (index >= links_.size()) {
        throw TopologyError("link index " + std::to_string(index) + " out of range");
    }
    return links_[index];
}

std::span<const Adjacency> Topology::neighbors(NodeId node) const noexcept {
    if (node >= adjacency_.size()) {
        return {};
    }
    return adjacency_[node];
}

std::optional<LinkIndex> Topology::link_index(NodeId a, NodeId b) const noexcept {
    auto it = link_lookup_.find(pair_key(a, b));
    if (it == link_lookup_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::vector<LinkIndex>> Topology::resolve_links(std::span<const NodeId> nodes) const {
    if (nodes.size() < 2) {
        return std::nullopt;
    }

    std::vector<LinkIndex> result;
    result.reserve(nodes.size() - 1);
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        auto index = link_index(nodes[i], nodes[i + 1]);
        if (!index) {
            return std::nullopt;
        }
        result.push_back(*index);
    }
    return result;
}

std::optional<double> Topology::path_distance(std::span<const NodeId> nodes) const noexcept {
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        auto index = link_index(nodes[i], nodes[i + 1]);
        if (!index) {
            return std::nullopt;
        }
        total += links_[*index].distance_km;
    }
    return total;
}

bool Topology::is_connected() const {
    if (adjacency_.empty()) {
        return true;
    }

    std::vector<bool> seen(adjacency_.size(), false);
    std::vector<NodeId> stack{0};
    seen[0] = true;
    std::size_t reached = 1;
    while (!stack.empty()) {
        NodeId node = stack.back();
        stack.pop_back();
        for (const auto& adj : adjacency_[node]) {
            if (!seen[adj.node]) {
                seen[adj.node] = true;
                ++reached;
                stack.push_back(adj.node);
            }
        }
    }
    return reached == adjacency_.size();
}

uint64_t Topology::pair_key(NodeId a, NodeId b) noexcept {
    auto lo = static_cast<uint64_t>(std::min(a, b));
    auto hi = static_cast<uint64_t>(std::max(a, b));
    return (lo << 32) | hi;
}

TopologyStats topology_stats(const Topology& topology) {
    TopologyStats stats;
    stats.nodes = topology.node_count();
    stats.links = topology.link_count();
    stats.connected = topology.is_connected();

    if (stats.nodes > 1) {
        double pairs = static_cast<double>(stats.nodes) * static_cast<double>(stats.nodes - 1) / 2.0;
        stats.density = static_cast<double>(stats.links) / pairs;
    }
    if (stats.nodes > 0) {
        stats.average_degree = 2.0 * static_cast<double>(stats.links) / static_cast<double>(stats.nodes);
    }

    bool first = true;
    for (const auto& link : topology.links()) {
        if (first) {
            stats.min_distance_km = link.distance_km;
            stats.max_distance_km = link.distance_km;
            first = false;
        }
        stats.min_distance_km = std::min(stats.min_distance_km, link.distance_km);
        stats.max_distance_km = std::max(stats.max_distance_km, link.distance_km);
        stats.total_distance_km += link.distance_km;
    }
    return stats;
}

} // namespace eonsim::core
