#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for allocation traces.
///
/// A no-op writer, a streaming JSON writer, an in-memory buffer used by the
/// tests, and a one-line-per-event textual writer.
///
/// @ingroup io_writers

#include <eonsim/core/trace_writer.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace eonsim::io {

/// @brief Trace writer that discards every event.
///
/// @ingroup io_writers
/// @see core::TraceWriter
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(uint64_t step) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams a JSON array to an output stream.
///
/// Each event becomes one object `{"step": n, "type": "...", ...fields}`
/// on its own line. The opening bracket is written on construction; call
/// finalize() (or destroy the writer) to close the array.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::TraceWriter, MemoryTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a JSON writer targeting @p output.
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);

    /// @brief Destructor; calls finalize() if not already called.
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(uint64_t step) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;

    /// @brief Add a string field; the value is JSON-escaped.
    void field(std::string_view key, std::string_view value) override;

    void end() override;

    /// @brief Write the closing bracket of the JSON array.
    ///
    /// Idempotent: later calls do nothing.
    void finalize();

private:
    static std::string escape_json_string(std::string_view str);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief A single trace event stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    uint64_t step{0};   ///< Processing step of the event.
    std::string type;   ///< Event type (e.g. "demand_blocked").
    /// @brief Named fields attached to the event.
    std::unordered_map<std::string, std::variant<double, uint64_t, std::string>> fields;

    /// @brief Typed field lookup.
    /// @return The value if @p key exists and holds a @p T, else @c std::nullopt.
    template <typename T>
    [[nodiscard]] std::optional<T> get(const std::string& key) const {
        auto it = fields.find(key);
        if (it == fields.end()) {
            return std::nullopt;
        }
        if (const auto* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }
};

/// @brief Trace writer that buffers every event as a TraceRecord.
///
/// Used by the tests to inspect what the scheduler emitted.
///
/// @ingroup io_writers
/// @see TraceRecord
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(uint64_t step) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Access the accumulated records.
    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of one event type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of_type(std::string_view type) const;

    /// @brief Discard all buffered records.
    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable trace writer, one line per event.
///
/// Lines look like
/// `[    12]        demand_allocated: demand_id = 4, start_slot = 0, ...`.
/// With colour enabled, allocations are green, blocks red and mode
/// changes yellow.
///
/// @ingroup io_writers
/// @see core::TraceWriter, JsonTraceWriter
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  Emit ANSI escape codes.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(uint64_t step) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    [[nodiscard]] std::string_view color_of(std::string_view type) const noexcept;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    uint64_t current_step_{0};
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace eonsim::io
