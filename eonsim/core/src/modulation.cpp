#include <eonsim/core/modulation.hpp>
#include <eonsim/core/error.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace eonsim::core {

ModulationTable::ModulationTable(std::vector<ModulationFormat> formats, double slot_width_ghz,
                                 std::size_t guard_band_slots)
    : formats_(std::move(formats))
    , slot_width_ghz_(slot_width_ghz)
    , guard_band_slots_(guard_band_slots) {
    if (formats_.empty()) {
        throw ConfigError("modulation table must not be empty");
    }
    if (!(slot_width_ghz_ > 0.0)) {
        throw ConfigError("slot_width_ghz must be positive");
    }
    for (const auto& format : formats_) {
        if (!(format.max_reach_km > 0.0) || !(format.spectral_efficiency > 0.0)) {
            throw ConfigError("modulation '" + format.name +
                              "' must have a positive reach and efficiency");
        }
    }
}

ModulationTable ModulationTable::from_config(const EonConfig& config) {
    return ModulationTable(config.modulations, config.slot_width_ghz, config.guard_band_slots);
}

const ModulationFormat& ModulationTable::select_modulation(double distance_km) const noexcept {
    const ModulationFormat* best = nullptr;
    for (const auto& format : formats_) {
        if (distance_km <= format.max_reach_km &&
            (best == nullptr || format.spectral_efficiency > best->spectral_efficiency)) {
            best = &format;
        }
    }
    if (best != nullptr) {
        return *best;
    }

    // Beyond every reach: fall back to the longest-reach format
    return *std::max_element(formats_.begin(), formats_.end(),
        [](const ModulationFormat& lhs, const ModulationFormat& rhs) {
            return lhs.max_reach_km < rhs.max_reach_km;
        });
}

const ModulationFormat& ModulationTable::find(std::string_view name) const {
    auto it = std::find_if(formats_.begin(), formats_.end(),
        [name](const ModulationFormat& format) { return format.name == name; });
    if (it == formats_.end()) {
        throw ConfigError("unknown modulation '" + std::string(name) + "'");
    }
    return *it;
}

std::size_t ModulationTable::required_slots(double bandwidth_gbps,
                                            const ModulationFormat& modulation) const noexcept {
    constexpr std::size_t UNPLACEABLE = std::numeric_limits<std::size_t>::max();
    // Payloads at or above this bound do not fit any ledger and would overflow the cast
    constexpr double MAX_PAYLOAD = 0x1p52;

    if (std::isnan(bandwidth_gbps)) {
        return UNPLACEABLE;
    }
    double payload = std::floor(bandwidth_gbps / (modulation.spectral_efficiency * slot_width_ghz_));
    if (!(payload < MAX_PAYLOAD)) {
        return UNPLACEABLE;
    }
    if (!(payload > 0.0)) {
        payload = 0.0;
    }
    const auto whole = static_cast<std::size_t>(payload);
    if (guard_band_slots_ > UNPLACEABLE - whole) {
        return UNPLACEABLE;
    }
    return std::max<std::size_t>(1, whole + guard_band_slots_);
}

std::size_t ModulationTable::required_slots(double bandwidth_gbps,
                                            std::string_view modulation_name) const {
    return required_slots(bandwidth_gbps, find(modulation_name));
}

} // namespace eonsim::core
