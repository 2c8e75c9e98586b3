#pragma once

/// @file trace_writers.hpp
/// @brief Sinks for the allocation event stream.
///
/// An allocator reports every decision through @ref core::TraceWriter. The
/// writers here decide where those events go: nowhere, a JSON array, a
/// vector kept in memory, or one readable line per event.
///
/// @ingroup io_writers

#include <taskalloc/core/trace_writer.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace taskalloc::io {

/// @brief Discards every event.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(uint64_t step) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Streams events as the elements of one JSON array.
///
/// Each event becomes an object `{"step": N, "type": "...", <fields>}`.
/// The array is opened on construction and closed by @ref finalize (or by
/// the destructor if finalize was never called), so the stream holds a
/// complete document once the writer is gone.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream; must outlive the writer.
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(uint64_t step) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the array and flush. Later calls do nothing.
    void finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// @brief Value of one event field as captured by MemoryTraceWriter.
using TraceValue = std::variant<double, uint64_t, std::string>;

/// @brief One buffered event.
/// @ingroup io_writers
struct TraceRecord {
    uint64_t step{0};                                    ///< Position in the run.
    std::string type;                                    ///< e.g. "task_assigned".
    std::unordered_map<std::string, TraceValue> fields;  ///< Keyed event data.
};

/// @brief Keeps every event in a vector for later inspection.
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(uint64_t step) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord pending_;
};

/// @brief Writes one aligned line per event for reading in a terminal.
///
/// Line layout: `#<step> <type padded to 18> key=value key=value`.
/// With colour enabled, assignments are green and tasks left unassigned
/// are red.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output         Destination stream; must outlive the writer.
    /// @param color_enabled  Emit ANSI colour codes around the event type.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = false);

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
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    uint64_t step_{0};
    std::string type_;
    std::string fields_;
};

/// @brief A trace destination together with the writer that fills it.
///
/// Opens the file (or uses stderr for `"-"`) and builds the writer for
/// @p format: `"none"`, `"json"` or `"text"`. The writer is destroyed before
/// the file it writes to, so a JSON trace is closed properly even when the
/// run that produced it ends with an exception.
///
/// @ingroup io_writers
class TraceOutput {
public:
    /// @throws LoaderError on an unknown format or a file that cannot be opened.
    TraceOutput(std::string_view format, const std::filesystem::path& path);

    TraceOutput(const TraceOutput&) = delete;
    TraceOutput& operator=(const TraceOutput&) = delete;
    TraceOutput(TraceOutput&&) = delete;
    TraceOutput& operator=(TraceOutput&&) = delete;

    /// @brief The writer to install on an allocator; nullptr for `"none"`.
    [[nodiscard]] core::TraceWriter* writer() noexcept { return writer_.get(); }

private:
    std::ofstream file_;
    std::unique_ptr<core::TraceWriter> writer_;  // declared after file_, destroyed first
};

} // namespace taskalloc::io
