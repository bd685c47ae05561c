/**
 * Chunked Record Writer
 *
 * Buffers records as CSV rows and writes them to the host in chunks. Each
 * chunk carries a metadata object (field names, inspector messages and
 * metrics, finished/partial flags) ahead of the row body. A chunk is written
 * when maxresultrows records are pending, or when flush() is called.
 */

#ifndef RECORD_WRITER_HPP
#define RECORD_WRITER_HPP

#include "byte_stream.hpp"
#include "chunked_common.hpp"
#include "flush_threshold_mixin.hpp"
#include "metadata_codec.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunked {

/**
 * Inspector
 * Messages and metrics reported to the host with the next chunk
 */
class Inspector {
public:
    /**
     * Key prefix of metric entries in the inspector object
     */
    static constexpr const char* kMetricPrefix = "metric.";

    using Message = std::pair<std::string, std::string>;   // (severity, text)

    void add_message(MessageSeverity severity, const std::string& text);

    /**
     * Store or overwrite a metric
     */
    void set_metric(const std::string& name, const SearchMetric& metric);

    const std::vector<Message>& messages() const;

    bool has_metric(const std::string& name) const;

    /**
     * @throws std::out_of_range if no metric has this name
     */
    const SearchMetric& metric(const std::string& name) const;

    size_t metric_count() const;

    bool empty() const;

    void clear();

    /**
     * Inspector object as sent on the wire:
     * {"messages": [[severity, text], ...], "metric.<name>": [d, n, in, out], ...}
     */
    Value to_value() const;

private:
    std::vector<Message> messages_;
    std::vector<std::pair<std::string, SearchMetric>> metrics_;  // First-set order
};

/**
 * Chunked record writer
 */
class RecordWriter : public FlushThresholdMixin<RecordWriter> {
    friend class FlushThresholdMixin<RecordWriter>;

public:
    static constexpr size_t kDefaultMaxResultRows = 50000;

    /**
     * Constructor
     * @param ofile Destination stream (not owned, never closed by the writer)
     * @param maxresultrows Records per chunk before an implicit flush
     */
    explicit RecordWriter(ByteStream& ofile, size_t maxresultrows = kDefaultMaxResultRows);

    /**
     * Buffer one record
     * New field names are appended to the field list in first-seen order.
     * Flushes a chunk if the threshold is reached.
     * @throws ContractError after the final chunk or if record is not an object
     * @throws MetadataEncodeError if a field name or nested value is not valid UTF-8;
     *         the record is dropped and the writer is unchanged
     */
    void write_record(const Record& record);

    /**
     * Buffer several records
     */
    void write_records(const std::vector<Record>& records);

    /**
     * Add a formatted message to the inspector
     * "{}" placeholders are replaced by the arguments in order
     * @throws MetadataEncodeError if the text is not valid UTF-8
     */
    template<typename... Args>
    void write_message(MessageSeverity severity, const std::string& format, const Args&... args) {
        std::vector<std::string> text_args;
        text_args.reserve(sizeof...(Args));
        (text_args.push_back(to_text(args)), ...);
        add_message(severity, Utils::format_message(format, text_args));
    }

    template<typename... Args>
    void write_debug(const std::string& format, const Args&... args) {
        write_message(MessageSeverity::DEBUG, format, args...);
    }

    template<typename... Args>
    void write_info(const std::string& format, const Args&... args) {
        write_message(MessageSeverity::INFO, format, args...);
    }

    template<typename... Args>
    void write_warning(const std::string& format, const Args&... args) {
        write_message(MessageSeverity::WARN, format, args...);
    }

    template<typename... Args>
    void write_error(const std::string& format, const Args&... args) {
        write_message(MessageSeverity::ERROR, format, args...);
    }

    template<typename... Args>
    void write_fatal(const std::string& format, const Args&... args) {
        write_message(MessageSeverity::FATAL, format, args...);
    }

    /**
     * Store or overwrite a named metric
     */
    void write_metric(const std::string& name, const SearchMetric& metric);

    /**
     * Write pending records and inspector state as one chunk
     * @throws ContractError after the final chunk
     */
    void flush(FlushMode mode = FlushMode::CONTINUE);

    /**
     * Flush with the two protocol flags
     * @throws ContractError if both flags are true
     */
    void flush(bool finished, bool partial);

    /**
     * Map host-supplied finished/partial flags to a flush mode
     * @throws ContractError unless both are booleans and at most one is true
     */
    static FlushMode flush_mode_from_flags(const Value& finished, const Value& partial);

    // ========================================================================
    // Getters
    // ========================================================================

    size_t pending_record_count() const;
    size_t committed_record_count() const;
    size_t chunk_count() const;
    const std::vector<std::string>& fieldnames() const;
    const Inspector& inspector() const;
    bool is_finished() const;
    size_t buffer_size_bytes() const;

private:
    using Row = std::vector<std::string>;   // Two cells per field: value, __mv_ value

    ByteStream& ofile_;
    MetadataEncoder encoder_;

    std::vector<std::string> fieldnames_;
    std::unordered_map<std::string, size_t> field_index_;
    std::vector<Row> rows_;
    size_t buffer_bytes_;

    Inspector inspector_;
    size_t committed_record_count_;
    bool finished_;

    // CRTP interface
    size_t get_buffer_size() const;
    size_t get_buffer_bytes() const;
    void perform_flush();

    void write_chunk(FlushMode mode);
    void require_open(const char* operation) const;
    void add_message(MessageSeverity severity, const std::string& text);
    void clear();

    Value build_metadata(FlushMode mode) const;
    std::string build_body() const;

    /**
     * Cells for one value: (single value, multi value)
     */
    std::pair<std::string, std::string> value_cells(const Value& value) const;

    /**
     * Text of a value inside a cell
     */
    std::string value_text(const Value& value) const;

    static void append_csv_row(std::string& out, const Row& cells, size_t width);
    static void append_csv_cell(std::string& out, const std::string& cell);

    template<typename T>
    static std::string to_text(const T& value) {
        if constexpr (std::is_floating_point<T>::value) {
            // Full round-trip precision, not the stream default of 6 digits
            return MetadataEncoder::encode_float(static_cast<double>(value));
        } else {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }
    }
};

} // namespace chunked

#endif // RECORD_WRITER_HPP
