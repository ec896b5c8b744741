#pragma once

/// @defgroup algo Algo Library
/// @brief Path ranking, allocation strategies and the demand scheduler.
///
/// The algo library implements routing and spectrum assignment on top of
/// the core ledger: Dijkstra and Yen path ranking behind the PathSource
/// interface, the SPFF baseline, the k-shortest-paths min-watermark
/// variant, the load-adaptive multipath allocator, and the DemandScheduler
/// that feeds them a batch. Depends on core only.

/// @defgroup algo_paths Paths
/// @ingroup algo
/// @brief Shortest and k-shortest path ranking.

/// @defgroup algo_allocators Allocators
/// @ingroup algo
/// @brief Routing and spectrum assignment strategies.

/// @defgroup algo_scheduler Scheduler
/// @ingroup algo
/// @brief Batch processing and comparison.

// Convenience header for the algo library
#include <eonsim/algo/k_shortest_paths.hpp>
#include <eonsim/algo/path_source.hpp>
#include <eonsim/algo/load_mode.hpp>
#include <eonsim/algo/allocator.hpp>
#include <eonsim/algo/first_fit_allocator.hpp>
#include <eonsim/algo/min_watermark_allocator.hpp>
#include <eonsim/algo/adaptive_allocator.hpp>
#include <eonsim/algo/demand_scheduler.hpp>
#include <eonsim/algo/batch.hpp>
