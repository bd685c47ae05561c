/**
 * Chunked Record Writer - Implementation
 */

#include "record_writer.hpp"
#include "chunk_reader.hpp"
#include <algorithm>

namespace chunked {

// ============================================================================
// Inspector Implementation
// ============================================================================

void Inspector::add_message(MessageSeverity severity, const std::string& text) {
    messages_.emplace_back(Utils::severity_name(severity), text);
}

void Inspector::set_metric(const std::string& name, const SearchMetric& metric) {
    for (auto& entry : metrics_) {
        if (entry.first == name) {
            entry.second = metric;
            return;
        }
    }
    metrics_.emplace_back(name, metric);
}

const std::vector<Inspector::Message>& Inspector::messages() const {
    return messages_;
}

bool Inspector::has_metric(const std::string& name) const {
    for (const auto& entry : metrics_) {
        if (entry.first == name) {
            return true;
        }
    }
    return false;
}

const SearchMetric& Inspector::metric(const std::string& name) const {
    for (const auto& entry : metrics_) {
        if (entry.first == name) {
            return entry.second;
        }
    }
    throw std::out_of_range("No metric named " + name);
}

size_t Inspector::metric_count() const {
    return metrics_.size();
}

bool Inspector::empty() const {
    return messages_.empty() && metrics_.empty();
}

void Inspector::clear() {
    messages_.clear();
    metrics_.clear();
}

Value Inspector::to_value() const {
    Value inspector = Value::object();

    if (!messages_.empty()) {
        Value messages = Value::array();
        for (const auto& message : messages_) {
            messages.push_back(Value::array({message.first, message.second}));
        }
        inspector["messages"] = std::move(messages);
    }

    for (const auto& entry : metrics_) {
        const SearchMetric& m = entry.second;
        inspector[kMetricPrefix + entry.first] = Value::array(
            {m.elapsed_seconds, m.invocation_count, m.input_count, m.output_count});
    }

    return inspector;
}

// ============================================================================
// RecordWriter Implementation
// ============================================================================

RecordWriter::RecordWriter(ByteStream& ofile, size_t maxresultrows)
    : FlushThresholdMixin<RecordWriter>(maxresultrows),
      ofile_(ofile),
      buffer_bytes_(0),
      committed_record_count_(0),
      finished_(false) {
}

size_t RecordWriter::pending_record_count() const {
    return rows_.size();
}

size_t RecordWriter::committed_record_count() const {
    return committed_record_count_;
}

size_t RecordWriter::chunk_count() const {
    return get_flush_count();
}

const std::vector<std::string>& RecordWriter::fieldnames() const {
    return fieldnames_;
}

const Inspector& RecordWriter::inspector() const {
    return inspector_;
}

bool RecordWriter::is_finished() const {
    return finished_;
}

size_t RecordWriter::buffer_size_bytes() const {
    return buffer_bytes_;
}

void RecordWriter::require_open(const char* operation) const {
    if (finished_) {
        throw ContractError(std::string("Cannot ") + operation + " after the final chunk");
    }
}

void RecordWriter::write_record(const Record& record) {
    require_open("write a record");

    if (!record.is_object()) {
        throw ContractError("Record must be an object, got " + std::string(record.type_name()));
    }

    // Encode every cell and check new field names before touching any state
    std::vector<std::string> new_names;
    std::vector<std::pair<size_t, std::pair<std::string, std::string>>> cells;
    cells.reserve(record.size());

    for (auto it = record.begin(); it != record.end(); ++it) {
        size_t index;
        auto known = field_index_.find(it.key());
        if (known != field_index_.end()) {
            index = known->second;
        } else {
            MetadataEncoder::check_text(it.key());
            index = fieldnames_.size() + new_names.size();
            new_names.push_back(it.key());
        }
        cells.emplace_back(index, value_cells(it.value()));
    }

    // Field names only grow within a chunk
    for (auto& name : new_names) {
        field_index_.emplace(name, fieldnames_.size());
        fieldnames_.push_back(std::move(name));
    }

    Row row(fieldnames_.size() * 2);
    for (auto& cell : cells) {
        buffer_bytes_ += cell.second.first.size() + cell.second.second.size() + 2;
        row[cell.first * 2] = std::move(cell.second.first);
        row[cell.first * 2 + 1] = std::move(cell.second.second);
    }

    rows_.push_back(std::move(row));

    check_and_flush();
}

void RecordWriter::write_records(const std::vector<Record>& records) {
    for (const auto& record : records) {
        write_record(record);
    }
}

void RecordWriter::add_message(MessageSeverity severity, const std::string& text) {
    require_open("write a message");
    MetadataEncoder::check_text(text);
    inspector_.add_message(severity, text);
}

void RecordWriter::write_metric(const std::string& name, const SearchMetric& metric) {
    require_open("write a metric");
    MetadataEncoder::check_text(name);
    inspector_.set_metric(name, metric);
}

FlushMode RecordWriter::flush_mode_from_flags(const Value& finished, const Value& partial) {
    if (!finished.is_boolean()) {
        throw ContractError("finished must be a boolean, got " + finished.dump());
    }
    if (!partial.is_boolean()) {
        throw ContractError("partial must be a boolean, got " + partial.dump());
    }

    bool is_finished = finished.get<bool>();
    bool is_partial = partial.get<bool>();

    if (is_finished && is_partial) {
        throw ContractError("finished and partial cannot both be true");
    }

    if (is_finished) return FlushMode::FINISHED;
    if (is_partial) return FlushMode::PARTIAL;
    return FlushMode::CONTINUE;
}

void RecordWriter::flush(bool finished, bool partial) {
    flush(flush_mode_from_flags(Value(finished), Value(partial)));
}

void RecordWriter::flush(FlushMode mode) {
    require_open("flush");
    write_chunk(mode);
}

// ============================================================================
// CRTP Interface Implementation
// ============================================================================

size_t RecordWriter::get_buffer_size() const {
    return rows_.size();
}

size_t RecordWriter::get_buffer_bytes() const {
    return buffer_bytes_;
}

void RecordWriter::perform_flush() {
    write_chunk(FlushMode::CONTINUE);
}

// ============================================================================
// Chunk Serialization
// ============================================================================

void RecordWriter::write_chunk(FlushMode mode) {
    // The whole chunk goes out in one write; on failure nothing is reset
    std::string chunk = frame_chunk(encoder_.encode(build_metadata(mode)), build_body());
    ofile_.write(chunk);

    size_t records = rows_.size();
    committed_record_count_ += records;
    record_flush(records, Utils::flush_mode_name(mode));
    clear();

    if (mode == FlushMode::FINISHED) {
        finished_ = true;
    }

    ofile_.flush();
}

void RecordWriter::clear() {
    fieldnames_.clear();
    field_index_.clear();
    rows_.clear();
    buffer_bytes_ = 0;
    inspector_.clear();
}

Value RecordWriter::build_metadata(FlushMode mode) const {
    Value metadata = Value::object();

    if (!fieldnames_.empty()) {
        metadata["fieldnames"] = fieldnames_;
    }

    if (!inspector_.empty()) {
        metadata["inspector"] = inspector_.to_value();
    }

    metadata["finished"] = (mode == FlushMode::FINISHED);
    metadata["partial"] = (mode == FlushMode::PARTIAL);

    return metadata;
}

std::string RecordWriter::build_body() const {
    if (rows_.empty()) {
        return "";
    }

    size_t width = fieldnames_.size() * 2;
    std::string body;
    body.reserve(buffer_bytes_ + width * 8);

    Row header;
    header.reserve(width);
    for (const auto& name : fieldnames_) {
        header.push_back(name);
        header.push_back("__mv_" + name);
    }
    append_csv_row(body, header, width);

    // Rows written before a field was first seen are shorter; pad them
    for (const auto& row : rows_) {
        append_csv_row(body, row, width);
    }

    return body;
}

std::string RecordWriter::value_text(const Value& value) const {
    switch (value.type()) {
        case Value::value_t::null:
            return "";
        case Value::value_t::boolean:
            return value.get<bool>() ? "1" : "0";
        case Value::value_t::string:
            return value.get<std::string>();
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
            return value.dump();
        case Value::value_t::number_float:
            return MetadataEncoder::encode_float(value.get<double>());
        default:
            return encoder_.encode(value);
    }
}

std::pair<std::string, std::string> RecordWriter::value_cells(const Value& value) const {
    if (value.is_null() || (value.is_array() && value.empty())) {
        return {"", ""};
    }

    if (value.is_array() && value.size() > 1) {
        // Multi-value: "a\nb" and "$a$;$b$" with '$' doubled inside values
        std::string single_value;
        std::string multi_value = "$";
        bool first = true;

        for (const auto& element : value) {
            std::string text = value_text(element);

            if (!first) {
                single_value += '\n';
                multi_value += "$;$";
            }
            first = false;

            single_value += text;
            for (char c : text) {
                if (c == '$') multi_value += '$';
                multi_value += c;
            }
        }

        multi_value += '$';
        return {single_value, multi_value};
    }

    const Value& scalar = value.is_array() ? value.front() : value;
    return {value_text(scalar), ""};
}

void RecordWriter::append_csv_cell(std::string& out, const std::string& cell) {
    bool needs_quotes = cell.find_first_of(",\"\r\n") != std::string::npos;

    if (!needs_quotes) {
        out += cell;
        return;
    }

    out += '"';
    for (char c : cell) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
}

void RecordWriter::append_csv_row(std::string& out, const Row& cells, size_t width) {
    for (size_t i = 0; i < width; i++) {
        if (i > 0) out += ',';
        if (i < cells.size()) {
            append_csv_cell(out, cells[i]);
        }
    }
    out += "\r\n";
}

} // namespace chunked
