#include <eonsim/core/config.hpp>
#include <eonsim/core/error.hpp>

#include <unordered_set>

namespace eonsim::core {

namespace {

void check_fraction(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigError(std::string("threshold '") + name + "' must lie in [0, 1]");
    }
}

} // anonymous namespace

std::vector<ModulationFormat> standard_modulation_formats() {
    return {
        {"BPSK", 4000.0, 1.0},
        {"QPSK", 2000.0, 2.0},
        {"8-QAM", 1000.0, 3.0},
        {"16-QAM", 500.0, 4.0},
    };
}

EonConfig default_config() {
    return EonConfig{};
}

void validate(const EonConfig& config) {
    if (config.slot_capacity == 0) {
        throw ConfigError("slot_capacity must be positive");
    }
    if (!(config.slot_width_ghz > 0.0)) {
        throw ConfigError("slot_width_ghz must be positive");
    }
    if (config.modulations.empty()) {
        throw ConfigError("modulation table must not be empty");
    }

    std::unordered_set<std::string> names;
    for (const auto& format : config.modulations) {
        if (!(format.max_reach_km > 0.0)) {
            throw ConfigError("modulation '" + format.name + "' must have a positive reach");
        }
        if (!(format.spectral_efficiency > 0.0)) {
            throw ConfigError("modulation '" + format.name + "' must have a positive efficiency");
        }
        if (!names.insert(format.name).second) {
            throw ConfigError("duplicate modulation name '" + format.name + "'");
        }
    }

    if (config.k_paths == 0 || config.path_fanout.high == 0 || config.path_fanout.extreme == 0) {
        throw ConfigError("path fan-out must be positive in every mode");
    }
    if (config.offset_caps.normal == 0 || config.offset_caps.high == 0 ||
        config.offset_caps.extreme == 0) {
        throw ConfigError("offset caps must be positive in every mode");
    }

    const auto& thr = config.thresholds;
    check_fraction(thr.high_watermark_ratio, "high_watermark_ratio");
    check_fraction(thr.high_utilization, "high_utilization");
    check_fraction(thr.extreme_watermark_ratio, "extreme_watermark_ratio");
    check_fraction(thr.extreme_utilization, "extreme_utilization");
    if (thr.high_watermark_ratio > thr.extreme_watermark_ratio ||
        thr.high_utilization > thr.extreme_utilization) {
        throw ConfigError("high thresholds must not exceed extreme thresholds");
    }
}

} // namespace eonsim::core
