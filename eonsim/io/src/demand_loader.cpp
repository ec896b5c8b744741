#include <eonsim/io/demand_loader.hpp>
#include <eonsim/io/error.hpp>

#include "json_helpers.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <limits>
#include <string>

namespace eonsim::io {

namespace {

std::string demand_context(std::size_t index) {
    return "demands[" + std::to_string(index) + "]";
}

core::NodeId get_node(const rapidjson::Value& obj, const char* name, const std::string& context) {
    auto value = detail::get_uint64(obj, name, context);
    if (value > std::numeric_limits<core::NodeId>::max()) {
        throw LoaderError(std::string("field '") + name + "' out of range", context);
    }
    return static_cast<core::NodeId>(value);
}

} // anonymous namespace

std::vector<core::Demand> load_demands(const std::filesystem::path& path) {
    return load_demands_from_string(detail::read_file(path));
}

std::vector<core::Demand> load_demands_from_string(std::string_view json) {
    auto doc = detail::parse_document(json, "demands");
    const auto& entries = detail::get_array(doc, "demands", "demands");

    std::vector<core::Demand> demands;
    demands.reserve(entries.Size());

    for (rapidjson::SizeType idx = 0; idx < entries.Size(); ++idx) {
        std::string ctx = demand_context(idx);

        core::Demand demand;
        demand.id = idx;
        demand.origin = get_node(entries[idx], "origin", ctx);
        demand.destination = get_node(entries[idx], "destination", ctx);
        demand.bandwidth_gbps = detail::get_double(entries[idx], "bandwidth_gbps", ctx);

        if (demand.origin == demand.destination) {
            throw LoaderError("origin and destination must differ", ctx);
        }
        if (!std::isfinite(demand.bandwidth_gbps) || demand.bandwidth_gbps <= 0.0) {
            throw LoaderError("bandwidth_gbps must be positive and finite", ctx);
        }
        demands.push_back(demand);
    }
    return demands;
}

void validate_demands(std::span<const core::Demand> demands, const core::Topology& topology) {
    for (std::size_t idx = 0; idx < demands.size(); ++idx) {
        const auto& demand = demands[idx];
        if (demand.origin >= topology.node_count() ||
            demand.destination >= topology.node_count()) {
            throw LoaderError("node not in topology (" + std::to_string(topology.node_count()) +
                                  " nodes)",
                              demand_context(idx));
        }
        if (!std::isfinite(demand.bandwidth_gbps) || demand.bandwidth_gbps <= 0.0) {
            throw LoaderError("bandwidth_gbps must be positive and finite", demand_context(idx));
        }
    }
}

void write_demands_to_stream(std::span<const core::Demand> demands, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("demands");
    writer.StartArray();
    for (const auto& demand : demands) {
        writer.StartObject();
        writer.Key("origin");
        writer.Uint(demand.origin);
        writer.Key("destination");
        writer.Uint(demand.destination);
        writer.Key("bandwidth_gbps");
        writer.Double(demand.bandwidth_gbps);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString();
}

void write_demands(std::span<const core::Demand> demands, const std::filesystem::path& path) {
    auto file = detail::open_for_writing(path);
    write_demands_to_stream(demands, file);
}

} // namespace eonsim::io
