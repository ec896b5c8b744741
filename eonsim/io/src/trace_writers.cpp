#include <eonsim/io/trace_writers.hpp>

#include <iomanip>
#include <sstream>
#include <utility>

namespace eonsim::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(uint64_t /*step*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output) {
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(uint64_t step) {
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;
    output_ << "  {\"step\": " << step;
}

void JsonTraceWriter::type(std::string_view name) {
    output_ << ", \"type\": \"" << escape_json_string(name) << "\"";
}

std::string JsonTraceWriter::escape_json_string(std::string_view str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0')
                        << std::setw(4) << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void JsonTraceWriter::field(std::string_view key, double value) {
    output_ << ", \"" << key << "\": " << std::setprecision(15) << value;
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    output_ << ", \"" << key << "\": " << value;
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    output_ << ", \"" << key << "\": \"" << escape_json_string(value) << "\"";
}

void JsonTraceWriter::end() {
    output_ << "}";
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (!first_record_) {
        output_ << "\n";
    }
    output_ << "]\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(uint64_t step) {
    current_ = TraceRecord{};
    current_.step = step;
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<TraceRecord> MemoryTraceWriter::records_of_type(std::string_view type) const {
    std::vector<TraceRecord> matching;
    for (const auto& record : records_) {
        if (record.type == type) {
            matching.push_back(record);
        }
    }
    return matching;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

namespace {
constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view GREEN = "\033[32m";
constexpr std::string_view RED = "\033[31m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view BOLD = "\033[1m";
} // anonymous namespace

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(uint64_t step) {
    current_step_ = step;
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(6) << value;
    current_fields_.push_back({std::string(key), oss.str()});
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

std::string_view TextualTraceWriter::color_of(std::string_view type) const noexcept {
    if (!color_enabled_) {
        return {};
    }
    if (type == "demand_allocated") {
        return GREEN;
    }
    if (type == "demand_blocked") {
        return RED;
    }
    if (type == "mode_change") {
        return YELLOW;
    }
    return BOLD;
}

void TextualTraceWriter::end() {
    // Format: [  step] event_name: key = value, key = value
    output_ << "[" << std::setw(6) << current_step_ << "] ";

    auto color = color_of(current_type_);
    output_ << color << std::setw(24) << std::right << current_type_
            << (color.empty() ? std::string_view{} : RESET) << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }

    output_ << "\n";
}

} // namespace eonsim::io
