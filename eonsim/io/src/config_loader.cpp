#include <eonsim/io/config_loader.hpp>
#include <eonsim/io/error.hpp>

#include "json_helpers.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <string>
#include <utility>

namespace eonsim::io {

namespace {

std::size_t get_size_or(const rapidjson::Value& obj, const char* name, std::size_t fallback,
                        const std::string& context) {
    return static_cast<std::size_t>(detail::get_uint64_or(obj, name, fallback, context));
}

const rapidjson::Value* get_object_or_null(const rapidjson::Value& obj, const char* name,
                                           const std::string& context) {
    if (!obj.HasMember(name)) {
        return nullptr;
    }
    const auto& member = obj[name];
    if (!member.IsObject()) {
        throw LoaderError(std::string("field '") + name + "' must be an object", context);
    }
    return &member;
}

void parse_modulations(core::EonConfig& config, const rapidjson::Value& doc) {
    if (!doc.HasMember("modulations")) {
        return;
    }
    const auto& entries = detail::get_array(doc, "modulations", "config");
    config.modulations.clear();
    for (rapidjson::SizeType idx = 0; idx < entries.Size(); ++idx) {
        std::string ctx = "modulations[" + std::to_string(idx) + "]";
        core::ModulationFormat format;
        format.name = detail::get_string(entries[idx], "name", ctx);
        format.max_reach_km = detail::get_double(entries[idx], "max_reach_km", ctx);
        format.spectral_efficiency = detail::get_double(entries[idx], "spectral_efficiency", ctx);
        config.modulations.push_back(std::move(format));
    }
}

} // anonymous namespace

core::EonConfig load_config(const std::filesystem::path& path) {
    return load_config_from_string(detail::read_file(path));
}

core::EonConfig load_config_from_string(std::string_view json) {
    auto doc = detail::parse_document(json, "config");
    auto config = core::default_config();

    config.slot_capacity = get_size_or(doc, "slot_capacity", config.slot_capacity, "config");
    config.slot_width_ghz = detail::get_double_or(doc, "slot_width_ghz", config.slot_width_ghz,
                                                  "config");
    config.guard_band_slots = get_size_or(doc, "guard_band_slots", config.guard_band_slots,
                                          "config");
    config.k_paths = get_size_or(doc, "k_paths", config.k_paths, "config");

    parse_modulations(config, doc);

    if (const auto* thresholds = get_object_or_null(doc, "thresholds", "config")) {
        auto& t = config.thresholds;
        t.high_watermark_ratio = detail::get_double_or(*thresholds, "high_watermark_ratio",
                                                       t.high_watermark_ratio, "thresholds");
        t.high_utilization = detail::get_double_or(*thresholds, "high_utilization",
                                                   t.high_utilization, "thresholds");
        t.extreme_watermark_ratio = detail::get_double_or(*thresholds, "extreme_watermark_ratio",
                                                          t.extreme_watermark_ratio, "thresholds");
        t.extreme_utilization = detail::get_double_or(*thresholds, "extreme_utilization",
                                                      t.extreme_utilization, "thresholds");
    }

    if (const auto* caps = get_object_or_null(doc, "offset_caps", "config")) {
        auto& c = config.offset_caps;
        c.normal = get_size_or(*caps, "normal", c.normal, "offset_caps");
        c.high = get_size_or(*caps, "high", c.high, "offset_caps");
        c.extreme = get_size_or(*caps, "extreme", c.extreme, "offset_caps");
    }

    if (const auto* paths = get_object_or_null(doc, "paths", "config")) {
        auto& p = config.path_fanout;
        p.high = get_size_or(*paths, "high", p.high, "paths");
        p.extreme = get_size_or(*paths, "extreme", p.extreme, "paths");
    }

    core::validate(config);
    return config;
}

void write_config_to_stream(const core::EonConfig& config, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("slot_capacity");
    writer.Uint64(config.slot_capacity);
    writer.Key("slot_width_ghz");
    writer.Double(config.slot_width_ghz);
    writer.Key("guard_band_slots");
    writer.Uint64(config.guard_band_slots);
    writer.Key("k_paths");
    writer.Uint64(config.k_paths);

    writer.Key("modulations");
    writer.StartArray();
    for (const auto& format : config.modulations) {
        writer.StartObject();
        writer.Key("name");
        writer.String(format.name.c_str(), static_cast<rapidjson::SizeType>(format.name.size()));
        writer.Key("max_reach_km");
        writer.Double(format.max_reach_km);
        writer.Key("spectral_efficiency");
        writer.Double(format.spectral_efficiency);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("thresholds");
    writer.StartObject();
    writer.Key("high_watermark_ratio");
    writer.Double(config.thresholds.high_watermark_ratio);
    writer.Key("high_utilization");
    writer.Double(config.thresholds.high_utilization);
    writer.Key("extreme_watermark_ratio");
    writer.Double(config.thresholds.extreme_watermark_ratio);
    writer.Key("extreme_utilization");
    writer.Double(config.thresholds.extreme_utilization);
    writer.EndObject();

    writer.Key("offset_caps");
    writer.StartObject();
    writer.Key("normal");
    writer.Uint64(config.offset_caps.normal);
    writer.Key("high");
    writer.Uint64(config.offset_caps.high);
    writer.Key("extreme");
    writer.Uint64(config.offset_caps.extreme);
    writer.EndObject();

    writer.Key("paths");
    writer.StartObject();
    writer.Key("high");
    writer.Uint64(config.path_fanout.high);
    writer.Key("extreme");
    writer.Uint64(config.path_fanout.extreme);
    writer.EndObject();

    writer.EndObject();
    out << buffer.GetString();
}

} // namespace eonsim::io
