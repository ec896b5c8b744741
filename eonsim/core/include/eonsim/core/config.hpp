#pragma once

/// @file config.hpp
/// @brief Immutable simulation configuration.
/// @ingroup core_config

#include <cstddef>
#include <string>
#include <vector>

namespace eonsim::core {

/// @brief One entry of the modulation table.
///
/// A modulation format trades optical reach for spectral efficiency: the
/// denser the constellation, the more bits per Hz but the shorter the
/// distance the signal can travel without regeneration.
///
/// @ingroup core_config
/// @see ModulationTable
struct ModulationFormat {
    std::string name;                ///< Display name (e.g. "16-QAM").
    double max_reach_km{0.0};        ///< Maximum transparent reach (km).
    double spectral_efficiency{0.0}; ///< Bits per second per Hz.

    bool operator==(const ModulationFormat& rhs) const = default;
};

/// @brief Load signals that switch the adaptive allocator between modes.
///
/// A mode is entered when either its watermark-ratio or its utilization
/// threshold is strictly exceeded. Extreme is checked before High.
///
/// @ingroup core_config
struct LoadThresholds {
    double high_watermark_ratio{0.70};
    double high_utilization{0.10};
    double extreme_watermark_ratio{0.92};
    double extreme_utilization{0.18};
};

/// @brief Maximum number of candidate offsets examined per path, per mode.
/// @ingroup core_config
struct OffsetCaps {
    std::size_t normal{10};
    std::size_t high{3};
    std::size_t extreme{1};
};

/// @brief Number of candidate paths requested under load.
///
/// Normal mode uses EonConfig::k_paths.
///
/// @ingroup core_config
struct PathFanout {
    std::size_t high{5};
    std::size_t extreme{3};
};

/// @brief The standard four-entry modulation table.
///
/// | Name   | Reach (km) | Efficiency (b/s/Hz) |
/// |--------|-----------:|--------------------:|
/// | BPSK   | 4000       | 1                   |
/// | QPSK   | 2000       | 2                   |
/// | 8-QAM  | 1000       | 3                   |
/// | 16-QAM | 500        | 4                   |
///
/// @return The table in the order listed above.
std::vector<ModulationFormat> standard_modulation_formats();

/// @brief Complete static configuration of a simulation run.
///
/// Built once (from defaults, from JSON via io::load_config, or in code)
/// and then passed by const reference to the ledger and allocator
/// constructors. Nothing mutates it during a run.
///
/// @ingroup core_config
/// @see validate, default_config
struct EonConfig {
    std::size_t slot_capacity{320};     ///< Frequency slots per link.
    double slot_width_ghz{12.5};        ///< Width of one slot (GHz).
    std::size_t guard_band_slots{1};    ///< Guard slots added to every demand.
    std::vector<ModulationFormat> modulations{standard_modulation_formats()};
    std::size_t k_paths{3};             ///< Path fan-out in Normal mode.
    LoadThresholds thresholds{};
    OffsetCaps offset_caps{};
    PathFanout path_fanout{};
};

/// @brief Return the default configuration.
/// @return An EonConfig with every field at its documented default.
EonConfig default_config();

/// @brief Check a configuration for contract violations.
///
/// @param config  Configuration to check.
/// @throws ConfigError  If the slot capacity is zero, the slot width is not
///         positive, the modulation table is empty or holds an entry with a
///         non-positive reach or efficiency or a duplicate name, any path
///         fan-out or offset cap is zero, or a threshold lies outside
///         `[0, 1]` or the High threshold exceeds the Extreme one.
void validate(const EonConfig& config);

} // namespace eonsim::core
