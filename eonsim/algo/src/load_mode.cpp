#include <eonsim/algo/load_mode.hpp>

namespace eonsim::algo {

LoadMode select_load_mode(double watermark_ratio, double utilization,
                          const core::LoadThresholds& thresholds) noexcept {
    if (watermark_ratio > thresholds.extreme_watermark_ratio ||
        utilization > thresholds.extreme_utilization) {
        return LoadMode::Extreme;
    }
    if (watermark_ratio > thresholds.high_watermark_ratio ||
        utilization > thresholds.high_utilization) {
        return LoadMode::High;
    }
    return LoadMode::Normal;
}

ModeParameters mode_parameters(LoadMode mode, const core::EonConfig& config) noexcept {
    switch (mode) {
    case LoadMode::Extreme:
        return {config.path_fanout.extreme, config.offset_caps.extreme};
    case LoadMode::High:
        return {config.path_fanout.high, config.offset_caps.high};
    case LoadMode::Normal:
        break;
    }
    return {config.k_paths, config.offset_caps.normal};
}

std::string_view to_string(LoadMode mode) noexcept {
    switch (mode) {
    case LoadMode::Normal:  return "normal";
    case LoadMode::High:    return "high";
    case LoadMode::Extreme: return "extreme";
    }
    return "unknown";
}

} // namespace eonsim::algo
