#pragma once

#include <cstdint>
#include <string_view>

namespace taskalloc::core {

/// @brief Receiver for the events of an allocation run.
/// @ingroup core
///
/// An allocator describes each decision it takes (run start, task given
/// to a member, task left unassigned, run end) as one record, built in
/// four steps: begin() with the record's step number, type() with the
/// event name, any number of field() calls, then end().
///
/// Step numbers start at 0 for every run and grow by one per record.
/// Allocators keep a non-owning pointer to the writer; with none set,
/// nothing is built.
///
/// @see algo::Allocator::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Open a record.
    /// @param step Position of the record within the current run.
    virtual void begin(uint64_t step) = 0;

    /// @brief Name the event, e.g. `"task_assigned"`.
    virtual void type(std::string_view name) = 0;

    /// @name Event data
    /// Attach a named value to the open record.
    /// @{
    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, uint64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;
    /// @}

    /// @brief Close the record.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace taskalloc::core
