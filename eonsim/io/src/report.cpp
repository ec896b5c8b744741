#include <eonsim/io/report.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <iomanip>
#include <string>
#include <string_view>

namespace eonsim::io {

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_batch(JsonWriter& writer, const algo::BatchResult& result, bool include_circuits) {
    writer.StartObject();
    writer.Key("algorithm");
    write_string(writer, result.algorithm);
    writer.Key("total");
    writer.Uint64(result.total);
    writer.Key("successful");
    writer.Uint64(result.successful);
    writer.Key("blocked");
    writer.Uint64(result.blocked);
    writer.Key("watermark");
    writer.Uint64(result.watermark);
    writer.Key("utilization");
    writer.Double(result.utilization);
    writer.Key("blocking_probability");
    writer.Double(result.blocking_probability);
    writer.Key("success_rate");
    writer.Double(result.success_rate());
    writer.Key("spectral_efficiency");
    writer.Double(result.spectral_efficiency());

    writer.Key("blocked_by_reason");
    writer.StartObject();
    for (const auto& [reason, count] : result.blocked_by_reason) {
        auto name = algo::to_string(reason);
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
        writer.Uint64(count);
    }
    writer.EndObject();

    writer.Key("demands_by_mode");
    writer.StartObject();
    for (const auto& [mode, count] : result.demands_by_mode) {
        auto name = algo::to_string(mode);
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
        writer.Uint64(count);
    }
    writer.EndObject();

    if (include_circuits) {
        writer.Key("circuits");
        writer.StartArray();
        for (const auto& circuit : result.circuits) {
            writer.StartObject();
            writer.Key("demand_id");
            writer.Uint64(circuit.demand_id);
            writer.Key("path");
            writer.StartArray();
            for (auto node : circuit.path.nodes) {
                writer.Uint(node);
            }
            writer.EndArray();
            writer.Key("distance_km");
            writer.Double(circuit.path.distance_km);
            writer.Key("start_slot");
            writer.Uint64(circuit.start_slot);
            writer.Key("slot_count");
            writer.Uint64(circuit.slot_count);
            writer.Key("modulation");
            write_string(writer, circuit.modulation);
            writer.EndObject();
        }
        writer.EndArray();
    }

    writer.EndObject();
}

void write_averages(JsonWriter& writer, const AlgorithmAverages& averages, std::size_t load) {
    writer.StartObject();
    writer.Key("watermark");
    writer.Double(averages.watermark);
    writer.Key("blocking_probability");
    writer.Double(averages.blocking_probability);
    writer.Key("utilization");
    writer.Double(averages.utilization);
    writer.Key("spectral_efficiency");
    writer.Double(spectral_efficiency(load, averages.watermark));
    writer.EndObject();
}

void print_rule(std::ostream& out, char c) {
    out << std::string(72, c) << "\n";
}

} // anonymous namespace

void write_batch_result_json(const algo::BatchResult& result, std::ostream& out,
                             bool include_circuits) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    write_batch(writer, result, include_circuits);
    out << buffer.GetString() << "\n";
}

void write_comparison_json(const algo::Comparison& comparison, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("baseline");
    write_batch(writer, comparison.baseline, false);
    writer.Key("adaptive");
    write_batch(writer, comparison.adaptive, false);
    writer.Key("watermark_improvement");
    writer.Double(comparison.watermark_improvement());
    writer.Key("blocking_improvement");
    writer.Double(comparison.blocking_improvement());
    writer.EndObject();

    out << buffer.GetString() << "\n";
}

void write_experiment_json(const ExperimentResult& result, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("baseline");
    write_string(writer, result.params.baseline);
    writer.Key("candidate");
    write_string(writer, result.params.candidate);
    writer.Key("runs");
    writer.Uint64(result.params.runs);

    writer.Key("points");
    writer.StartArray();
    for (const auto& point : result.points) {
        writer.StartObject();
        writer.Key("load");
        writer.Uint64(point.load);
        writer.Key("baseline");
        write_averages(writer, point.baseline, point.load);
        writer.Key("candidate");
        write_averages(writer, point.candidate, point.load);
        writer.Key("watermark_improvement");
        writer.Double(point.watermark_improvement());
        writer.Key("blocking_improvement");
        writer.Double(point.blocking_improvement());
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("mean_watermark_improvement");
    writer.Double(result.mean_watermark_improvement());
    writer.Key("mean_blocking_improvement");
    writer.Double(result.mean_blocking_improvement());
    writer.EndObject();

    out << buffer.GetString() << "\n";
}

void print_batch_summary(const algo::BatchResult& result, std::ostream& out) {
    out << result.algorithm << ": " << result.successful << "/" << result.total
        << " placed, " << result.blocked << " blocked\n"
        << std::fixed << std::setprecision(3)
        << "  watermark:            " << result.watermark << "\n"
        << "  utilization:          " << result.utilization << "\n"
        << "  blocking probability: " << result.blocking_probability << "\n"
        << "  spectral efficiency:  " << result.spectral_efficiency() << "\n";
    for (const auto& [reason, count] : result.blocked_by_reason) {
        out << "  blocked (" << algo::to_string(reason) << "): " << count << "\n";
    }
    for (const auto& [mode, count] : result.demands_by_mode) {
        out << "  mode " << algo::to_string(mode) << ": " << count << "\n";
    }
    out << std::defaultfloat;
}

void print_comparison_summary(const algo::Comparison& comparison, std::ostream& out) {
    print_batch_summary(comparison.baseline, out);
    print_batch_summary(comparison.adaptive, out);
    out << std::fixed << std::setprecision(3)
        << "watermark improvement: " << comparison.watermark_improvement() << "\n"
        << "blocking improvement:  " << comparison.blocking_improvement() << "\n"
        << std::defaultfloat;
}

void print_experiment_summary(const ExperimentResult& result, std::ostream& out) {
    const auto& base = result.params.baseline;
    const auto& cand = result.params.candidate;

    print_rule(out, '=');
    out << std::left << std::setw(8) << "Load" << std::setw(14) << (base + " WM")
        << std::setw(14) << (cand + " WM") << std::setw(12) << "WM gain"
        << std::setw(12) << (base + " Bl") << std::setw(12) << (cand + " Bl") << "\n";
    print_rule(out, '-');

    out << std::fixed;
    for (const auto& point : result.points) {
        out << std::setw(8) << point.load << std::setprecision(2)
            << std::setw(14) << point.baseline.watermark
            << std::setw(14) << point.candidate.watermark
            << std::setw(12) << point.watermark_improvement() << std::setprecision(3)
            << std::setw(12) << point.baseline.blocking_probability
            << std::setw(12) << point.candidate.blocking_probability << "\n";
    }
    print_rule(out, '-');

    out << std::setprecision(2) << "Mean watermark improvement: "
        << result.mean_watermark_improvement() << "\n"
        << std::setprecision(3) << "Mean blocking improvement:  "
        << result.mean_blocking_improvement() << "\n\n"
        << "Spectral efficiency (demands per slot):\n";
    for (const auto& point : result.points) {
        out << "  load " << point.load << ": " << base << "="
            << spectral_efficiency(point.load, point.baseline.watermark) << ", " << cand << "="
            << spectral_efficiency(point.load, point.candidate.watermark) << "\n";
    }
    out << std::defaultfloat << std::right;
}

} // namespace eonsim::io
