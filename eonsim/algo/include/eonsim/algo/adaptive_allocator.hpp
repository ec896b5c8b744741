#pragma once

#include <eonsim/algo/allocator.hpp>
#include <eonsim/algo/load_mode.hpp>

#include <eonsim/core/spectrum_ledger.hpp>

#include <cstddef>
#include <optional>
#include <span>

namespace eonsim::algo {

/// @brief Simulated effect of placing a window on a path.
///
/// Computed against the ledger without mutating it. Watermarks are the
/// per-link watermarks of the path's own links, not the global one.
///
/// @ingroup algo_allocators
struct PlacementScore {
    std::size_t increase{0};             ///< Rise of the path's max link watermark.
    std::size_t resulting{0};            ///< Path's max link watermark after placement.
    double path_length_km{0.0};          ///< Path distance.
    std::size_t offset{0};               ///< Start slot of the window.
    double average_link_watermark{0.0};  ///< Mean link watermark after placement.
};

/// @brief Simulate a placement and score it.
///
/// @param ledger          Current occupancy (not modified).
/// @param links           Links of the candidate path.
/// @param start           Start slot of the window.
/// @param slots           Window width.
/// @param path_length_km  Distance of the candidate path.
/// @return The score of the candidate.
[[nodiscard]] PlacementScore score_placement(const core::SpectrumLedger& ledger,
                                             std::span<const core::LinkIndex> links,
                                             std::size_t start, std::size_t slots,
                                             double path_length_km) noexcept;

/// @brief Strict lexicographic preference between two candidates.
///
/// | Mode    | Order (ascending)                                           |
/// |---------|-------------------------------------------------------------|
/// | Normal  | increase, resulting, path length, offset, average watermark |
/// | High    | path length, offset, increase, resulting                    |
/// | Extreme | none: the incumbent is always kept                          |
///
/// @return @c true if @p candidate strictly beats @p incumbent.
[[nodiscard]] bool better_candidate(LoadMode mode, const PlacementScore& candidate,
                                    const PlacementScore& incumbent) noexcept;

/// @brief Load-aware multipath allocator.
///
/// Before every demand the allocator classifies the network load from the
/// ledger's watermark ratio and utilization (see select_load_mode()) and
/// adapts its search:
///
/// - **Normal**: up to EonConfig::k_paths paths, up to OffsetCaps::normal
///   best-fit offsets each; the candidate that least raises the path's
///   watermark wins.
/// - **High**: more paths, fewer offsets; short paths and low offsets win.
/// - **Extreme**: first-fit on each path in turn; the first feasible window
///   is committed immediately.
///
/// The best candidate across all paths is committed. If the commit fails
/// the demand is blocked; the runner-up is not tried.
///
/// @ingroup algo_allocators
/// @see Allocator, LoadMode, better_candidate
class AdaptiveAllocator : public Allocator {
public:
    /// @cond INTERNAL
    using Allocator::Allocator;
    /// @endcond

    AllocationOutcome allocate(const core::Demand& demand) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "adaptive"; }

    /// @brief Mode used for the most recent demand.
    /// @return @c std::nullopt before the first allocate() call.
    [[nodiscard]] std::optional<LoadMode> last_mode() const noexcept { return last_mode_; }

private:
    AllocationOutcome place(const core::Demand& demand, LoadMode mode);

    std::optional<LoadMode> last_mode_;
};

} // namespace eonsim::algo
