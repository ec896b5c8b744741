#pragma once

/// @file modulation.hpp
/// @brief Modulation selection and slot sizing.
/// @ingroup core_spectrum

#include <eonsim/core/config.hpp>

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace eonsim::core {

/// @brief Read-only modulation table with the slot-sizing rule.
///
/// Maps a path distance to the most spectrally efficient modulation whose
/// reach covers it, and a bandwidth to the number of contiguous slots the
/// demand occupies. Stateless once constructed; all queries are pure.
///
/// @ingroup core_spectrum
/// @see ModulationFormat, EonConfig
class ModulationTable {
public:
    /// @brief Build a table from explicit entries.
    ///
    /// @param formats           Table entries; order is kept and breaks ties.
    /// @param slot_width_ghz    Width of one frequency slot (GHz).
    /// @param guard_band_slots  Guard slots added to every demand.
    /// @throws ConfigError  If @p formats is empty, holds a non-positive
    ///         reach or efficiency, or if @p slot_width_ghz is not positive.
    ModulationTable(std::vector<ModulationFormat> formats, double slot_width_ghz,
                    std::size_t guard_band_slots);

    /// @brief Build the table described by a configuration.
    /// @param config  Source configuration.
    /// @return Table using the configuration's entries, slot width and guard band.
    /// @throws ConfigError  If the configuration's modulation fields are invalid.
    static ModulationTable from_config(const EonConfig& config);

    /// @brief Choose the modulation for a path of the given length.
    ///
    /// Returns the highest-efficiency entry whose reach is at least
    /// @p distance_km. When the distance exceeds every reach the entry with
    /// the largest reach is returned instead, so every finite path gets an
    /// assignable modulation.
    ///
    /// @param distance_km  Path length (km).
    /// @return Reference to an entry of this table.
    [[nodiscard]] const ModulationFormat& select_modulation(double distance_km) const noexcept;

    /// @brief Look up an entry by name.
    /// @param name  Modulation name, e.g. "QPSK".
    /// @return The matching entry.
    /// @throws ConfigError  If no entry carries that name.
    [[nodiscard]] const ModulationFormat& find(std::string_view name) const;

    /// @brief Number of slots a demand occupies with a given modulation.
    ///
    /// `floor(bandwidth / (efficiency * slot_width)) + guard_band`, never
    /// less than 1. A bandwidth too large to size (or NaN) yields
    /// `std::numeric_limits<std::size_t>::max()`, which no ledger can hold.
    ///
    /// @param bandwidth_gbps  Requested line rate (Gb/s).
    /// @param modulation      Modulation used on the path.
    /// @return Contiguous slot count including the guard band.
    [[nodiscard]] std::size_t required_slots(double bandwidth_gbps,
                                             const ModulationFormat& modulation) const noexcept;

    /// @brief Slot count for a modulation given by name.
    /// @param bandwidth_gbps   Requested line rate (Gb/s).
    /// @param modulation_name  Name of an entry of this table.
    /// @return Contiguous slot count including the guard band.
    /// @throws ConfigError  If @p modulation_name is not in the table.
    [[nodiscard]] std::size_t required_slots(double bandwidth_gbps,
                                             std::string_view modulation_name) const;

    [[nodiscard]] std::span<const ModulationFormat> formats() const noexcept { return formats_; }
    [[nodiscard]] double slot_width_ghz() const noexcept { return slot_width_ghz_; }
    [[nodiscard]] std::size_t guard_band_slots() const noexcept { return guard_band_slots_; }

private:
    std::vector<ModulationFormat> formats_;
    double slot_width_ghz_;
    std::size_t guard_band_slots_;
};

} // namespace eonsim::core
