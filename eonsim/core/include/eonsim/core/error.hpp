#pragma once

#include <stdexcept>
#include <string>

namespace eonsim::core {

/// @brief Base exception for all errors raised by the core library.
///
/// Per-demand allocation failures are never reported through exceptions;
/// they are classified as blocked by the allocators. Exceptions are reserved
/// for contract violations such as an invalid configuration or a malformed
/// topology.
///
/// @see ConfigError, TopologyError
/// @ingroup core
class EonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when the static configuration is invalid.
///
/// For example an empty modulation table, a zero slot capacity, thresholds
/// in the wrong order, or a lookup of a modulation name that the table does
/// not contain.
///
/// @see EonConfig, validate, ModulationTable::find
/// @ingroup core
class ConfigError : public EonError {
public:
    using EonError::EonError;
};

/// @brief Thrown when a topology operation receives invalid input.
///
/// For example a link between unknown nodes, a self-loop, a duplicate link,
/// or a non-positive distance.
///
/// @see Topology::add_link
/// @ingroup core
class TopologyError : public EonError {
public:
    using EonError::EonError;
};

} // namespace eonsim::core
