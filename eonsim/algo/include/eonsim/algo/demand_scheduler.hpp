#pragma once

#include <eonsim/algo/allocator.hpp>
#include <eonsim/algo/load_mode.hpp>

#include <eonsim/core/trace_writer.hpp>
#include <eonsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace eonsim::algo {

/// @brief Outcome of one batch of demands.
/// @ingroup algo_scheduler
struct BatchResult {
    std::string algorithm;            ///< Allocator name.
    std::size_t total{0};             ///< Demands processed.
    std::size_t successful{0};        ///< Demands placed.
    std::size_t blocked{0};           ///< Demands blocked.
    std::size_t watermark{0};         ///< Ledger watermark after the batch.
    double utilization{0.0};          ///< Ledger utilization after the batch.
    double blocking_probability{0.0}; ///< blocked / total, 0 for an empty batch.
    std::map<BlockReason, std::size_t> blocked_by_reason;
    std::map<LoadMode, std::size_t> demands_by_mode;
    std::vector<Circuit> circuits;    ///< Committed placements in processing order.

    /// @brief successful / total, 0 for an empty batch.
    [[nodiscard]] double success_rate() const noexcept;

    /// @brief Placed demands per slot of watermark, 0 when nothing is placed.
    [[nodiscard]] double spectral_efficiency() const noexcept;
};

/// @brief Order demands by descending bandwidth.
///
/// The sort is stable: demands with equal bandwidth keep their input order.
///
/// @param demands  Demands in input order.
/// @return A sorted copy.
[[nodiscard]] std::vector<core::Demand> sort_by_bandwidth(std::span<const core::Demand> demands);

/// @brief Fraction of blocked demands.
/// @return `blocked / total`, or 0 when @p total is 0.
[[nodiscard]] double blocking_probability(std::size_t blocked, std::size_t total) noexcept;

/// @brief Feeds a demand batch through an Allocator.
/// @ingroup algo_scheduler
///
/// Demands are sorted once by descending bandwidth and then handed to the
/// allocator strictly one at a time, with no deferral or retry. Each
/// outcome is counted and, when a TraceWriter is installed, recorded as a
/// `demand_allocated` or `demand_blocked` event. Adaptive allocators that
/// report a load mode also produce a `mode_change` event whenever the mode
/// differs from the previous demand's; it carries the watermark and
/// utilization read before that demand was allocated. A final `batch_complete` event
/// carries the summary.
///
/// @see Allocator, BatchResult
class DemandScheduler {
public:
    /// @brief Construct a scheduler over an allocator.
    /// @param allocator  Strategy used for every demand (must outlive this).
    explicit DemandScheduler(Allocator& allocator);

    /// @brief Install the trace writer (nullptr disables tracing).
    void set_trace_writer(core::TraceWriter* writer) noexcept { writer_ = writer; }

    /// @brief Process a batch of demands.
    ///
    /// The allocator's ledger is not reset: it accumulates placements from
    /// any earlier batch.
    ///
    /// @param demands  Demands in input order.
    /// @return Counters and ledger statistics after the batch.
    BatchResult run(std::span<const core::Demand> demands);

private:
    template <typename F>
    void trace(uint64_t step, F&& func);

    Allocator& allocator_;
    core::TraceWriter* writer_{nullptr};
};

template <typename F>
void DemandScheduler::trace(uint64_t step, F&& func) {
    if (writer_) {
        writer_->begin(step);
        func(*writer_);
        writer_->end();
    }
}

} // namespace eonsim::algo
