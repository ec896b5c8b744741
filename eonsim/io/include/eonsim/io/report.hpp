#pragma once

/// @file report.hpp
/// @brief JSON result files and human-readable summaries.
/// @ingroup io_report

#include <eonsim/io/experiment.hpp>

#include <eonsim/algo/batch.hpp>
#include <eonsim/algo/demand_scheduler.hpp>

#include <ostream>

namespace eonsim::io {

/// @brief Write a batch result as JSON.
///
/// Counters, ledger statistics, block and mode breakdowns, and, when
/// @p include_circuits is set, every committed circuit.
void write_batch_result_json(const algo::BatchResult& result, std::ostream& out,
                             bool include_circuits = true);

/// @brief Write both sides of a comparison and the improvements as JSON.
void write_comparison_json(const algo::Comparison& comparison, std::ostream& out);

/// @brief Write the per-load averages of an experiment as JSON.
void write_experiment_json(const ExperimentResult& result, std::ostream& out);

/// @brief Print a short textual summary of one batch.
void print_batch_summary(const algo::BatchResult& result, std::ostream& out);

/// @brief Print both batch summaries and the improvements.
void print_comparison_summary(const algo::Comparison& comparison, std::ostream& out);

/// @brief Print the experiment table: one row per load, then mean
///        improvements and spectral efficiency per load.
void print_experiment_summary(const ExperimentResult& result, std::ostream& out);

} // namespace eonsim::io
