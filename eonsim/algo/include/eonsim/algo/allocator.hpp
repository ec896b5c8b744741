#pragma once

#include <eonsim/algo/load_mode.hpp>
#include <eonsim/algo/path_source.hpp>

#include <eonsim/core/config.hpp>
#include <eonsim/core/modulation.hpp>
#include <eonsim/core/spectrum_ledger.hpp>
#include <eonsim/core/topology.hpp>
#include <eonsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eonsim::algo {

/// @brief Why a demand could not be placed.
/// @ingroup algo_allocators
enum class BlockReason {
    None,             ///< The demand was placed.
    NoPath,           ///< The path source returned no route.
    UnresolvedLink,   ///< A path edge has no matching topology link.
    NoSpectrum,       ///< No contiguous window is free on the path's links.
    CommitConflict    ///< The chosen window was no longer free at commit time.
};

/// @brief Snake-case name of a block reason (e.g. "no_spectrum").
[[nodiscard]] std::string_view to_string(BlockReason reason) noexcept;

/// @brief A committed placement.
///
/// Holds everything needed to release the placement again: the link set,
/// the window and the modulation used to size it.
///
/// @ingroup algo_allocators
struct Circuit {
    uint64_t demand_id{0};
    core::Path path;
    std::vector<core::LinkIndex> links;
    std::size_t start_slot{0};
    std::size_t slot_count{0};
    std::string modulation;

    /// @brief One past the last occupied slot.
    [[nodiscard]] std::size_t end_slot() const noexcept { return start_slot + slot_count; }
};

/// @brief Result of one Allocator::allocate() call.
///
/// Exactly one of @c circuit and a non-None @c block_reason is set.
/// @c mode is filled in by allocators that classify the load.
///
/// @ingroup algo_allocators
struct AllocationOutcome {
    std::optional<Circuit> circuit;
    BlockReason block_reason{BlockReason::None};
    std::optional<LoadMode> mode;

    [[nodiscard]] bool allocated() const noexcept { return circuit.has_value(); }
};

/// @brief Abstract routing and spectrum assignment strategy.
/// @ingroup algo_allocators
///
/// An Allocator turns one demand into either a committed window on the
/// shared SpectrumLedger or a BlockReason. Concrete implementations decide
/// which paths to consider and which window to pick; the base class holds
/// the collaborators and implements the steps they share (sizing a path and
/// committing a window).
///
/// Per-demand failures are never thrown; they are reported through
/// AllocationOutcome::block_reason.
///
/// @see FirstFitAllocator, MinWatermarkAllocator, AdaptiveAllocator
class Allocator {
public:
    /// @brief Construct an allocator over a ledger.
    ///
    /// @param ledger    Occupancy grid mutated by allocate().
    /// @param topology  Graph used to resolve path edges to link indices.
    /// @param paths     Ranked path supplier.
    /// @param config    Static configuration (copied).
    /// @throws core::ConfigError  If @p config is invalid or the ledger row
    ///         count differs from the topology's link count.
    Allocator(core::SpectrumLedger& ledger, const core::Topology& topology, PathSource& paths,
              const core::EonConfig& config);

    virtual ~Allocator() = default;

    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;
    Allocator(Allocator&&) = delete;
    Allocator& operator=(Allocator&&) = delete;

    /// @brief Route and place one demand.
    ///
    /// On success the window is already committed on the ledger.
    ///
    /// @param demand  Demand to place.
    /// @return The committed circuit, or the reason the demand was blocked.
    virtual AllocationOutcome allocate(const core::Demand& demand) = 0;

    /// @brief Short identifier of the strategy (e.g. "spff").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] const core::SpectrumLedger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const core::EonConfig& config() const noexcept { return config_; }
    [[nodiscard]] const core::ModulationTable& modulations() const noexcept { return modulations_; }

protected:
    /// @brief A candidate path sized for a demand.
    struct PathPlan {
        core::Path path;
        std::vector<core::LinkIndex> links;
        const core::ModulationFormat* modulation;
        std::size_t slots;
    };

    /// @brief Resolve a path's links and size the demand for it.
    /// @return The plan, or @c std::nullopt if an edge is not a topology link.
    [[nodiscard]] std::optional<PathPlan> plan_path(const core::Path& path,
                                                    double bandwidth_gbps) const;

    /// @brief Commit a window and build the resulting outcome.
    /// @return The circuit, or BlockReason::CommitConflict if the ledger
    ///         refused the window.
    AllocationOutcome commit(const core::Demand& demand, PathPlan plan, std::size_t start);

    [[nodiscard]] static AllocationOutcome blocked(BlockReason reason);

    [[nodiscard]] core::SpectrumLedger& mutable_ledger() noexcept { return ledger_; }
    [[nodiscard]] const core::Topology& topology() const noexcept { return topology_; }
    [[nodiscard]] PathSource& path_source() noexcept { return paths_; }

private:
    core::SpectrumLedger& ledger_;
    const core::Topology& topology_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    PathSource& paths_;
    core::EonConfig config_;
    core::ModulationTable modulations_;
};

} // namespace eonsim::algo
