#pragma once

#include <eonsim/core/topology.hpp>
#include <eonsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace eonsim::algo {

/// @brief Abstract supplier of ranked candidate paths.
/// @ingroup algo_paths
///
/// Allocators only consume the ordered path list; they never look at how it
/// was produced. Implementations must return loop-free paths in ascending
/// distance, and an empty list when no route exists.
///
/// @see KShortestPathSource, Allocator
class PathSource {
public:
    virtual ~PathSource() = default;

    /// @brief Return up to @p k candidate paths, best first.
    ///
    /// @param origin       Source node.
    /// @param destination  Destination node.
    /// @param k            Maximum number of paths.
    /// @return Ranked paths; empty if the nodes are not connected.
    virtual std::vector<core::Path> paths(core::NodeId origin, core::NodeId destination,
                                          std::size_t k) = 0;

protected:
    PathSource() = default;
    PathSource(const PathSource&) = default;
    PathSource& operator=(const PathSource&) = default;
    PathSource(PathSource&&) = default;
    PathSource& operator=(PathSource&&) = default;
};

/// @brief PathSource backed by Yen's k-shortest-paths over a Topology.
///
/// Results are memoised per node pair; a request for more paths than were
/// previously computed recomputes and replaces the cached list.
///
/// @ingroup algo_paths
/// @see k_shortest_paths
class KShortestPathSource : public PathSource {
public:
    /// @brief Construct over a topology.
    /// @param topology  Graph to search (must outlive this source).
    explicit KShortestPathSource(const core::Topology& topology);

    std::vector<core::Path> paths(core::NodeId origin, core::NodeId destination,
                                  std::size_t k) override;

private:
    struct Entry {
        std::size_t k;
        std::vector<core::Path> paths;
    };

    const core::Topology& topology_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::unordered_map<uint64_t, Entry> cache_;
};

} // namespace eonsim::algo
