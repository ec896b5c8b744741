#pragma once

/// @file config_loader.hpp
/// @brief Loading and writing EonConfig as JSON.
/// @ingroup io_loaders

#include <eonsim/core/config.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace eonsim::io {

/// @brief Load a configuration from a JSON file.
///
/// Every field is optional; missing fields keep their default value.
/// @code{.json}
/// {
///   "slot_capacity": 320, "slot_width_ghz": 12.5, "guard_band_slots": 1,
///   "k_paths": 3,
///   "modulations": [{"name": "BPSK", "max_reach_km": 4000, "spectral_efficiency": 1}],
///   "thresholds": {"high_watermark_ratio": 0.70, "high_utilization": 0.10,
///                  "extreme_watermark_ratio": 0.92, "extreme_utilization": 0.18},
///   "offset_caps": {"normal": 10, "high": 3, "extreme": 1},
///   "paths": {"high": 5, "extreme": 3}
/// }
/// @endcode
/// A @c modulations array replaces the whole default table.
///
/// @throws LoaderError       If the file cannot be read, the JSON is
///         malformed, or a field has the wrong type.
/// @throws core::ConfigError If the resulting configuration is invalid.
core::EonConfig load_config(const std::filesystem::path& path);

/// @brief Load a configuration from a JSON string.
/// @see load_config
core::EonConfig load_config_from_string(std::string_view json);

/// @brief Write every field of a configuration as JSON.
void write_config_to_stream(const core::EonConfig& config, std::ostream& out);

} // namespace eonsim::io
