#pragma once

#include <cstdint>
#include <string_view>

namespace eonsim::core {

/// @brief Abstract interface for recording allocation trace events.
/// @ingroup core
///
/// Implementations of TraceWriter serialise events to a specific format
/// (JSON, text, memory buffer, etc.). Each trace record is built
/// incrementally:
///   1. begin() -- opens a new record at a given processing step
///   2. type()  -- sets the event type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// The step is the 0-based position of the demand in processing order
/// (after the bandwidth sort). Batch-level records use the number of
/// processed demands.
///
/// The DemandScheduler holds an optional pointer to a TraceWriter. When no
/// writer is installed the overhead is a single null-pointer check.
///
/// @see algo::DemandScheduler::set_trace_writer()
class TraceWriter {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record.
    /// @param step Processing step at which the event occurs.
    virtual void begin(uint64_t step) = 0;

    /// @brief Set the event type name for the current record.
    /// @param name A short identifier for the event category
    ///        (e.g. `"demand_allocated"`, `"mode_change"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    ///
    /// After this call the writer is ready for a new begin()/end() cycle.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace eonsim::core
