#include <eonsim/algo/k_shortest_paths.hpp>

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <set>
#include <utility>

namespace eonsim::algo {

using core::NodeId;
using core::Path;
using core::Topology;

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

// Dijkstra restricted to the nodes and links not marked as blocked
std::optional<Path> restricted_dijkstra(const Topology& topology, NodeId origin,
                                        NodeId destination,
                                        const std::vector<bool>& blocked_nodes,
                                        const std::vector<bool>& blocked_links) {
    const std::size_t node_count = topology.node_count();
    const auto links = topology.links();
    const auto no_prev = static_cast<NodeId>(node_count);

    std::vector<double> dist(node_count, INF);
    std::vector<NodeId> prev(node_count, no_prev);

    using Entry = std::pair<double, NodeId>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<>> queue;
    dist[origin] = 0.0;
    queue.emplace(0.0, origin);

    while (!queue.empty()) {
        auto [distance, node] = queue.top();
        queue.pop();
        if (distance > dist[node]) {
            continue;
        }
        if (node == destination) {
            break;
        }
        for (const auto& adj : topology.neighbors(node)) {
            if (blocked_links[adj.link] || blocked_nodes[adj.node]) {
                continue;
            }
            double candidate = distance + links[adj.link].distance_km;
            if (candidate < dist[adj.node]) {
                dist[adj.node] = candidate;
                prev[adj.node] = node;
                queue.emplace(candidate, adj.node);
            }
        }
    }

    if (dist[destination] == INF) {
        return std::nullopt;
    }

    Path path;
    path.distance_km = dist[destination];
    for (NodeId node = destination; node != no_prev; node = prev[node]) {
        path.nodes.push_back(node);
    }
    std::reverse(path.nodes.begin(), path.nodes.end());
    return path;
}

bool valid_endpoints(const Topology& topology, NodeId origin, NodeId destination) {
    return origin < topology.node_count() && destination < topology.node_count() &&
           origin != destination;
}

} // anonymous namespace

std::optional<Path> shortest_path(const Topology& topology, NodeId origin, NodeId destination) {
    if (!valid_endpoints(topology, origin, destination)) {
        return std::nullopt;
    }
    std::vector<bool> no_nodes(topology.node_count(), false);
    std::vector<bool> no_links(topology.link_count(), false);
    return restricted_dijkstra(topology, origin, destination, no_nodes, no_links);
}

std::vector<Path> k_shortest_paths(const Topology& topology, NodeId origin, NodeId destination,
                                   std::size_t k) {
    if (k == 0) {
        return {};
    }
    auto first = shortest_path(topology, origin, destination);
    if (!first) {
        return {};
    }

    std::vector<Path> accepted{std::move(*first)};
    // Ordered by (distance, node sequence): deterministic and deduplicating
    std::set<std::pair<double, std::vector<NodeId>>> candidates;

    while (accepted.size() < k) {
        const std::vector<NodeId> previous = accepted.back().nodes;

        for (std::size_t i = 0; i + 1 < previous.size(); ++i) {
            const NodeId spur = previous[i];
            const std::vector<NodeId> root(previous.begin(),
                                           previous.begin() + static_cast<std::ptrdiff_t>(i + 1));

            std::vector<bool> blocked_links(topology.link_count(), false);
            for (const auto& path : accepted) {
                if (path.nodes.size() > i + 1 &&
                    std::equal(root.begin(), root.end(), path.nodes.begin())) {
                    if (auto link = topology.link_index(path.nodes[i], path.nodes[i + 1])) {
                        blocked_links[*link] = true;
                    }
                }
            }

            std::vector<bool> blocked_nodes(topology.node_count(), false);
            for (std::size_t j = 0; j < i; ++j) {
                blocked_nodes[root[j]] = true;
            }

            auto spur_path = restricted_dijkstra(topology, spur, destination, blocked_nodes,
                                                 blocked_links);
            if (!spur_path) {
                continue;
            }

            std::vector<NodeId> total = root;
            total.insert(total.end(), spur_path->nodes.begin() + 1, spur_path->nodes.end());

            bool known = std::any_of(accepted.begin(), accepted.end(),
                                     [&total](const Path& path) { return path.nodes == total; });
            if (!known) {
                double distance = topology.path_distance(total).value_or(INF);
                candidates.emplace(distance, std::move(total));
            }
        }

        if (candidates.empty()) {
            break;
        }
        auto best = candidates.begin();
        accepted.push_back(Path{best->second, best->first});
        candidates.erase(best);
    }

    return accepted;
}

} // namespace eonsim::algo
