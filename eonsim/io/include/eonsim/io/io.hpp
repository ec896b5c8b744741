#pragma once

/// @defgroup io IO Library
/// @brief Loaders, demand generation, trace writers and reports.
///
/// The io library reads topologies, demand sequences and configurations
/// from JSON, generates seeded random demand sets, provides the concrete
/// TraceWriter implementations, and runs and reports load sweeps.
/// Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief JSON topology, demand and configuration files.

/// @defgroup io_generation Generation
/// @ingroup io
/// @brief Seeded random demand sets.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief Null, JSON, in-memory and textual trace output.

/// @defgroup io_experiment Experiment
/// @ingroup io
/// @brief Load sweeps over several seeds.

/// @defgroup io_report Reports
/// @ingroup io
/// @brief JSON result files and summary tables.

// Convenience header for the io library
#include <eonsim/io/error.hpp>
#include <eonsim/io/topology_loader.hpp>
#include <eonsim/io/demand_loader.hpp>
#include <eonsim/io/config_loader.hpp>
#include <eonsim/io/demand_generation.hpp>
#include <eonsim/io/trace_writers.hpp>
#include <eonsim/io/experiment.hpp>
#include <eonsim/io/report.hpp>
