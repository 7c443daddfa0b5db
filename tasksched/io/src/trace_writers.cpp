#include <tasksched/io/trace_writers.hpp>

#include <iomanip>
#include <sstream>

namespace tasksched::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::TimePoint /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, int64_t /*value*/) {}
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
    if (!finalized_) {
        finalize();
    }
}

void JsonTraceWriter::begin(core::TimePoint time) {
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;

    output_ << "  {\"time\": " << core::time_to_units(time);
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
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0')
                        << std::setw(4) << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void JsonTraceWriter::field(std::string_view key, double value) {
    output_ << ", \"" << escape_json_string(key) << "\": " << std::setprecision(15) << value;
}

void JsonTraceWriter::field(std::string_view key, int64_t value) {
    output_ << ", \"" << escape_json_string(key) << "\": " << value;
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    output_ << ", \"" << escape_json_string(key) << "\": " << value;
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    output_ << ", \"" << escape_json_string(key) << "\": \"" << escape_json_string(value) << "\"";
}

void JsonTraceWriter::end() {
    output_ << "}";
}

void JsonTraceWriter::finalize() {
    if (!finalized_) {
        if (!first_record_) {
            output_ << "\n";
        }
        output_ << "]\n";
        output_.flush();
        finalized_ = true;
    }
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_units(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, int64_t value) {
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

std::vector<TraceRecord> MemoryTraceWriter::records_of(std::string_view type) const {
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

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    current_time_ = core::time_to_units(time);
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.push_back({std::string(key), oss.str()});
}

void TextualTraceWriter::field(std::string_view key, int64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

std::string_view TextualTraceWriter::color_of(std::string_view type) const {
    if (!color_enabled_) {
        return {};
    }
    if (type == "task_start") {
        return "\033[32m";
    }
    if (type == "task_completion" || type == "deadline_met") {
        return "\033[34m";
    }
    if (type == "deadline_missed" || type == "mutation_rejected" || type == "capacity_violation") {
        return "\033[31m";
    }
    if (type.starts_with("task_")) {
        return "\033[33m";
    }
    return {};
}

void TextualTraceWriter::end() {
    // Format: [  time] (+delta)   event_name: key = value, key = value
    output_ << "[" << std::setw(6) << current_time_ << "] ";

    if (prev_time_ && current_time_ != *prev_time_) {
        output_ << "(+" << std::setw(4) << (current_time_ - *prev_time_) << ") ";
    } else {
        output_ << "(     ) ";
    }

    std::string_view color = color_of(current_type_);
    output_ << color << std::setw(20) << std::right << current_type_ << ":";
    if (!color.empty()) {
        output_ << "\033[0m";
    }

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }

    output_ << "\n";
    prev_time_ = current_time_;
}

// =============================================================================
// TeeTraceWriter
// =============================================================================

void TeeTraceWriter::begin(core::TimePoint time) {
    first_.begin(time);
    second_.begin(time);
}

void TeeTraceWriter::type(std::string_view name) {
    first_.type(name);
    second_.type(name);
}

void TeeTraceWriter::field(std::string_view key, double value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::field(std::string_view key, int64_t value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::field(std::string_view key, uint64_t value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::field(std::string_view key, std::string_view value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::end() {
    first_.end();
    second_.end();
}

// =============================================================================
// Field helpers
// =============================================================================

int64_t get_int_field(const TraceRecord& record, const std::string& key, int64_t default_val) {
    auto iter = record.fields.find(key);
    if (iter == record.fields.end()) {
        return default_val;
    }
    if (std::holds_alternative<int64_t>(iter->second)) {
        return std::get<int64_t>(iter->second);
    }
    if (std::holds_alternative<uint64_t>(iter->second)) {
        return static_cast<int64_t>(std::get<uint64_t>(iter->second));
    }
    if (std::holds_alternative<double>(iter->second)) {
        return static_cast<int64_t>(std::get<double>(iter->second));
    }
    return default_val;
}

std::string get_string_field(const TraceRecord& record, const std::string& key,
                             const std::string& default_val) {
    auto iter = record.fields.find(key);
    if (iter == record.fields.end() || !std::holds_alternative<std::string>(iter->second)) {
        return default_val;
    }
    return std::get<std::string>(iter->second);
}

} // namespace tasksched::io
