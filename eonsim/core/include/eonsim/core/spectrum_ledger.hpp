#pragma once

/// @file spectrum_ledger.hpp
/// @brief Per-link frequency-slot occupancy and watermark tracking.
/// @ingroup core_spectrum

#include <eonsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace eonsim::core {

struct EonConfig;
class Topology;

/// @brief Occupancy grid of `link_count() x slot_capacity()` cells.
///
/// Each link owns a bit-set of `slot_capacity()` slots packed in 64-bit
/// words, so contiguity checks and free-run searches proceed a word at a
/// time. The ledger also tracks the global *watermark*: one past the highest
/// occupied slot on any link, or 0 when the grid is empty.
///
/// All queries apply the spectrum-continuity constraint: a window
/// `[start, start + slots)` is feasible for a link set only if it is free on
/// every link of the set simultaneously.
///
/// Mutators never throw on bad arguments. Out-of-range link indices, an
/// empty link set, a zero slot count or a window beyond capacity make
/// commit() and release() return @c false without touching the grid, and
/// make the queries report no fit.
///
/// A ledger is owned by exactly one batch run. commit() re-validates the
/// window before writing, but the check-then-set pair is not atomic, so a
/// ledger must never be shared between concurrent allocators.
///
/// @ingroup core_spectrum
/// @see Topology, algo::Allocator
class SpectrumLedger {
public:
    /// @brief Create an empty ledger.
    /// @param link_count     Number of links (rows).
    /// @param slot_capacity  Slots per link (columns), must be positive.
    /// @throws ConfigError  If @p slot_capacity is zero.
    SpectrumLedger(std::size_t link_count, std::size_t slot_capacity);

    /// @brief Create an empty ledger sized for a topology.
    /// @param topology  Provides the link count.
    /// @param config    Provides the slot capacity.
    /// @throws ConfigError  If the configured slot capacity is zero.
    SpectrumLedger(const Topology& topology, const EonConfig& config);

    /// @name Placement queries
    /// @{

    /// @brief Lowest offset whose window is free on every link of the set.
    ///
    /// @param links         Links the window must be free on.
    /// @param slots_needed  Window width.
    /// @return The smallest feasible start slot, or @c std::nullopt when no
    ///         window fits within capacity or the arguments are invalid.
    [[nodiscard]] std::optional<std::size_t> find_first_fit(std::span<const LinkIndex> links,
                                                            std::size_t slots_needed) const;

    /// @brief Rank feasible offsets by their effect on the link-set watermark.
    ///
    /// Feasible offsets are split into those whose window ends at or below
    /// the highest per-link watermark of @p links (no increase) and those
    /// that raise it. The no-increase group is returned first in ascending
    /// offset order; remaining positions are filled from the increase group
    /// ordered by (increase, resulting watermark, offset).
    ///
    /// @param links          Links the window must be free on.
    /// @param slots_needed   Window width.
    /// @param max_positions  Maximum number of offsets returned.
    /// @return Up to @p max_positions start slots, best first. Empty when no
    ///         window fits or the arguments are invalid.
    [[nodiscard]] std::vector<std::size_t> find_best_fit_positions(std::span<const LinkIndex> links,
                                                                   std::size_t slots_needed,
                                                                   std::size_t max_positions) const;

    /// @}

    /// @name Mutation
    /// @{

    /// @brief Occupy a window on every link of the set.
    ///
    /// Re-checks that every targeted cell is free before writing anything.
    /// On success raises the watermark to at least `start + slots_needed`.
    ///
    /// @return @c true if the window was committed, @c false (and no cell
    ///         changed) if any cell was occupied or the arguments are invalid.
    [[nodiscard]] bool commit(std::span<const LinkIndex> links, std::size_t start,
                              std::size_t slots_needed);

    /// @brief Free a window on every link of the set.
    ///
    /// Cells are cleared whether or not they were occupied; the watermark is
    /// then recomputed by scanning every link.
    ///
    /// @return @c false (and no cell changed) if the arguments are invalid.
    [[nodiscard]] bool release(std::span<const LinkIndex> links, std::size_t start,
                               std::size_t slots_needed);

    /// @brief Free every cell and reset the watermark to 0.
    void reset() noexcept;

    /// @}

    /// @name Observers
    /// @{

    [[nodiscard]] std::size_t link_count() const noexcept { return link_count_; }
    [[nodiscard]] std::size_t slot_capacity() const noexcept { return slot_capacity_; }

    /// @brief One past the highest occupied slot network-wide (0 if empty).
    [[nodiscard]] std::size_t watermark() const noexcept { return watermark_; }

    /// @brief watermark() divided by slot_capacity().
    [[nodiscard]] double watermark_ratio() const noexcept;

    /// @brief One past the highest occupied slot on one link.
    /// @return 0 for an empty or out-of-range link.
    [[nodiscard]] std::size_t link_watermark(LinkIndex link) const noexcept;

    /// @brief Whether a single cell is occupied.
    /// @return @c false for out-of-range coordinates.
    [[nodiscard]] bool is_occupied(LinkIndex link, std::size_t slot) const noexcept;

    /// @brief Number of occupied cells over the whole grid.
    [[nodiscard]] std::size_t occupied_cells() const noexcept;

    /// @brief Fraction of all cells that are occupied, in `[0, 1]`.
    [[nodiscard]] double utilization() const noexcept;

    /// @brief Fraction of one link's slots that are occupied.
    /// @return 0 for an out-of-range link.
    [[nodiscard]] double link_utilization(LinkIndex link) const noexcept;

    /// @}

private:
    using Word = uint64_t;
    static constexpr std::size_t WORD_BITS = 64;

    [[nodiscard]] bool valid_window(std::span<const LinkIndex> links, std::size_t start,
                                    std::size_t slots_needed) const noexcept;
    [[nodiscard]] std::span<Word> row(LinkIndex link) noexcept;
    [[nodiscard]] std::span<const Word> row(LinkIndex link) const noexcept;
    [[nodiscard]] std::vector<Word> merged_rows(std::span<const LinkIndex> links) const;
    [[nodiscard]] std::size_t max_link_watermark(std::span<const LinkIndex> links) const noexcept;
    [[nodiscard]] std::size_t row_watermark(std::span<const Word> words) const noexcept;

    template<typename Fn>
    void for_each_free_start(std::span<const Word> merged, std::size_t slots_needed, Fn&& fn) const;

    void recompute_watermark() noexcept;

    std::size_t link_count_;
    std::size_t slot_capacity_;
    std::size_t words_per_link_;
    std::vector<Word> bits_;
    std::size_t watermark_{0};
};

} // namespace eonsim::core
