#include <eonsim/algo/path_source.hpp>
#include <eonsim/algo/k_shortest_paths.hpp>

#include <algorithm>

namespace eonsim::algo {

KShortestPathSource::KShortestPathSource(const core::Topology& topology)
    : topology_(topology) {}

std::vector<core::Path> KShortestPathSource::paths(core::NodeId origin, core::NodeId destination,
                                                   std::size_t k) {
    uint64_t key = (static_cast<uint64_t>(origin) << 32) | destination;

    auto it = cache_.find(key);
    if (it == cache_.end() || it->second.k < k) {
        Entry entry{k, k_shortest_paths(topology_, origin, destination, k)};
        it = cache_.insert_or_assign(key, std::move(entry)).first;
    }

    const auto& cached = it->second.paths;
    auto count = std::min(k, cached.size());
    return {cached.begin(), cached.begin() + static_cast<std::ptrdiff_t>(count)};
}

} // namespace eonsim::algo
