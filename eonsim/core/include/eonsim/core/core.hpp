#pragma once

/// @defgroup core Core Library
/// @brief Topology, spectrum ledger, modulation and configuration.
///
/// The core library provides the data model of an elastic optical network:
/// the undirected Topology with stable link indices, the SpectrumLedger
/// occupancy grid with its watermark, the ModulationTable slot-sizing rule,
/// the immutable EonConfig, and the TraceWriter seam. It has no
/// dependencies on allocation strategies or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Node and link identifiers, demands and paths.

/// @defgroup core_config Configuration
/// @ingroup core
/// @brief Immutable simulation configuration.

/// @defgroup core_topology Topology
/// @ingroup core
/// @brief Undirected weighted graph.

/// @defgroup core_spectrum Spectrum
/// @ingroup core
/// @brief Occupancy ledger, modulation selection and slot sizing.

// Convenience header for the core library
#include <eonsim/core/types.hpp>
#include <eonsim/core/error.hpp>
#include <eonsim/core/config.hpp>
#include <eonsim/core/modulation.hpp>
#include <eonsim/core/topology.hpp>
#include <eonsim/core/spectrum_ledger.hpp>
#include <eonsim/core/trace_writer.hpp>
