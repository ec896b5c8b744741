#pragma once

/// @file demand_loader.hpp
/// @brief Loading and writing demand sequences.
/// @ingroup io_loaders

#include <eonsim/core/topology.hpp>
#include <eonsim/core/types.hpp>

#include <filesystem>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

namespace eonsim::io {

/// @brief Load a demand sequence from a JSON file.
///
/// Format:
/// @code{.json}
/// {"demands": [{"origin": 0, "destination": 5, "bandwidth_gbps": 120.5}]}
/// @endcode
///
/// Each demand's @c id is its index in the array.
///
/// @throws LoaderError  If the file cannot be read, the JSON is malformed,
///         a demand's origin equals its destination, or a bandwidth is not
///         positive.
std::vector<core::Demand> load_demands(const std::filesystem::path& path);

/// @brief Load a demand sequence from a JSON string.
/// @see load_demands
std::vector<core::Demand> load_demands_from_string(std::string_view json);

/// @brief Check that every demand's endpoints exist in the topology and
/// that its bandwidth is positive and finite.
/// @throws LoaderError  Naming the first offending demand.
void validate_demands(std::span<const core::Demand> demands, const core::Topology& topology);

/// @brief Write demands in the format read by load_demands().
void write_demands(std::span<const core::Demand> demands, const std::filesystem::path& path);

/// @brief Write demands to a stream.
/// @see write_demands
void write_demands_to_stream(std::span<const core::Demand> demands, std::ostream& out);

} // namespace eonsim::io
