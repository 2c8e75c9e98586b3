#include <taskalloc/io/trace_writers.hpp>
#include <taskalloc/io/error.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <iomanip>
#include <iostream>
#include <sstream>

namespace taskalloc::io {

namespace {

rapidjson::SizeType json_length(std::string_view str) {
    return static_cast<rapidjson::SizeType>(str.size());
}

} // anonymous namespace

// NullTraceWriter

void NullTraceWriter::begin(uint64_t /*step*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// JsonTraceWriter

struct JsonTraceWriter::Impl {
    explicit Impl(std::ostream& output)
        : stream(output)
        , writer(stream) {}

    rapidjson::OStreamWrapper stream;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer;
    bool finalized{false};
};

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : impl_(std::make_unique<Impl>(output)) {
    impl_->writer.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(uint64_t step) {
    impl_->writer.StartObject();
    impl_->writer.Key("step");
    impl_->writer.Uint64(step);
}

void JsonTraceWriter::type(std::string_view name) {
    impl_->writer.Key("type");
    impl_->writer.String(name.data(), json_length(name));
}

void JsonTraceWriter::field(std::string_view key, double value) {
    impl_->writer.Key(key.data(), json_length(key));
    impl_->writer.Double(value);
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    impl_->writer.Key(key.data(), json_length(key));
    impl_->writer.Uint64(value);
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    impl_->writer.Key(key.data(), json_length(key));
    impl_->writer.String(value.data(), json_length(value));
}

void JsonTraceWriter::end() {
    impl_->writer.EndObject();
}

void JsonTraceWriter::finalize() {
    if (impl_->finalized) {
        return;
    }
    impl_->writer.EndArray();
    impl_->stream.Flush();
    impl_->finalized = true;
}

// MemoryTraceWriter

void MemoryTraceWriter::begin(uint64_t step) {
    pending_ = TraceRecord{};
    pending_.step = step;
}

void MemoryTraceWriter::type(std::string_view name) {
    pending_.type = name;
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    pending_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    pending_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    pending_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(pending_));
    pending_ = TraceRecord{};
}

// TextualTraceWriter

namespace {

constexpr std::string_view COLOR_RESET = "\033[0m";

std::string_view color_for(std::string_view type) {
    if (type == "task_assigned") {
        return "\033[32m";
    }
    if (type == "task_unassigned") {
        return "\033[31m";
    }
    return {};
}

} // anonymous namespace

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(uint64_t step) {
    step_ = step;
    type_.clear();
    fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    type_ = name;
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << ' ' << key << '=' << std::setprecision(10) << value;
    fields_ += oss.str();
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    fields_ += ' ';
    fields_ += key;
    fields_ += '=';
    fields_ += std::to_string(value);
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    fields_ += ' ';
    fields_ += key;
    fields_ += '=';
    fields_ += value;
}

void TextualTraceWriter::end() {
    std::string_view color = color_enabled_ ? color_for(type_) : std::string_view{};

    output_ << '#' << std::left << std::setw(5) << step_ << ' ';
    if (!color.empty()) {
        output_ << color;
    }
    output_ << std::setw(18) << type_;
    if (!color.empty()) {
        output_ << COLOR_RESET;
    }
    output_ << std::right << fields_ << '\n';
}

// TraceOutput

TraceOutput::TraceOutput(std::string_view format, const std::filesystem::path& path) {
    if (format == "none") {
        return;
    }
    if (format != "json" && format != "text") {
        throw LoaderError("unknown trace format (expected none, json or text)",
                          std::string(format));
    }

    std::ostream* stream = &std::cerr;
    if (path != "-") {
        file_.open(path);
        if (!file_) {
            throw LoaderError("cannot open trace output file", path.string());
        }
        stream = &file_;
    }

    if (format == "json") {
        writer_ = std::make_unique<JsonTraceWriter>(*stream);
    } else {
        writer_ = std::make_unique<TextualTraceWriter>(*stream);
    }
}

} // namespace taskalloc::io
