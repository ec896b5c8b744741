#pragma once

/// @file topology_loader.hpp
/// @brief Loading, writing and built-in network topologies.
/// @ingroup io_loaders

#include <eonsim/core/topology.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace eonsim::io {

/// @brief Load a topology from a JSON file.
///
/// Format:
/// @code{.json}
/// {"nodes": 3, "links": [{"source": 0, "target": 1, "distance_km": 100.0}]}
/// @endcode
///
/// Link indices follow the order of the @c links array.
///
/// @param path  Filesystem path to the JSON file.
/// @return The topology.
/// @throws LoaderError  If the file cannot be read, the JSON is malformed,
///         or a link is invalid (unknown node, self-loop, duplicate,
///         non-positive distance).
core::Topology load_topology(const std::filesystem::path& path);

/// @brief Load a topology from a JSON string.
/// @see load_topology
core::Topology load_topology_from_string(std::string_view json);

/// @brief Write a topology in the format read by load_topology().
void write_topology_to_stream(const core::Topology& topology, std::ostream& out);

/// @brief The 14-node, 23-link NSFNET backbone with distances in km.
core::Topology nsfnet_topology();

} // namespace eonsim::io
