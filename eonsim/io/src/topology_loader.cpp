#include <eonsim/io/topology_loader.hpp>
#include <eonsim/io/error.hpp>

#include "json_helpers.hpp"

#include <eonsim/core/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <array>
#include <limits>
#include <string>

namespace eonsim::io {

namespace {

struct NsfnetLink {
    core::NodeId source;
    core::NodeId target;
    double distance_km;
};

constexpr std::size_t NSFNET_NODES = 14;

constexpr std::array<NsfnetLink, 23> NSFNET_LINKS{{
    {0, 1, 2100.0},  {0, 2, 3000.0},  {0, 6, 4800.0},  {1, 2, 1200.0},  {1, 3, 1500.0},
    {2, 5, 3600.0},  {3, 4, 1200.0},  {3, 6, 3900.0},  {4, 5, 2400.0},  {4, 6, 1200.0},
    {5, 6, 2700.0},  {5, 9, 2100.0},  {5, 8, 3600.0},  {6, 7, 1500.0},  {7, 8, 1500.0},
    {7, 10, 1500.0}, {8, 9, 1500.0},  {8, 11, 600.0},  {8, 12, 600.0},  {8, 13, 600.0},
    {10, 11, 1200.0}, {11, 12, 600.0}, {12, 13, 300.0},
}};

core::NodeId to_node_id(uint64_t value, const std::string& context) {
    if (value > std::numeric_limits<core::NodeId>::max()) {
        throw LoaderError("node id out of range", context);
    }
    return static_cast<core::NodeId>(value);
}

} // anonymous namespace

core::Topology load_topology(const std::filesystem::path& path) {
    return load_topology_from_string(detail::read_file(path));
}

core::Topology load_topology_from_string(std::string_view json) {
    auto doc = detail::parse_document(json, "topology");

    auto node_count = detail::get_uint64(doc, "nodes", "topology");
    if (node_count == 0) {
        throw LoaderError("topology must have at least one node", "topology");
    }
    core::Topology topology(static_cast<std::size_t>(node_count));

    const auto& links = detail::get_array(doc, "links", "topology");
    for (rapidjson::SizeType idx = 0; idx < links.Size(); ++idx) {
        std::string ctx = "links[" + std::to_string(idx) + "]";
        auto source = to_node_id(detail::get_uint64(links[idx], "source", ctx), ctx);
        auto target = to_node_id(detail::get_uint64(links[idx], "target", ctx), ctx);
        double distance = detail::get_double(links[idx], "distance_km", ctx);
        try {
            topology.add_link(source, target, distance);
        } catch (const core::TopologyError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
    return topology;
}

void write_topology_to_stream(const core::Topology& topology, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("nodes");
    writer.Uint64(topology.node_count());
    writer.Key("links");
    writer.StartArray();
    for (const auto& link : topology.links()) {
        writer.StartObject();
        writer.Key("source");
        writer.Uint(link.source);
        writer.Key("target");
        writer.Uint(link.target);
        writer.Key("distance_km");
        writer.Double(link.distance_km);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString();
}

core::Topology nsfnet_topology() {
    core::Topology topology(NSFNET_NODES);
    for (const auto& link : NSFNET_LINKS) {
        topology.add_link(link.source, link.target, link.distance_km);
    }
    return topology;
}

} // namespace eonsim::io
