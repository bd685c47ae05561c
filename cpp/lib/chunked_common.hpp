/**
 * Chunked Protocol Common Data Structures
 *
 * Shared types for the chunked record protocol: records, metrics,
 * message severities, flush modes and the exception hierarchy.
 */

#ifndef CHUNKED_COMMON_HPP
#define CHUNKED_COMMON_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace chunked {

/**
 * Value type for records and metadata.
 * Object keys keep insertion order.
 */
using Value = nlohmann::ordered_json;

/**
 * A record is a Value holding an object: field name -> value
 */
using Record = nlohmann::ordered_json;

/**
 * Named metric reported through the inspector
 */
struct SearchMetric {
    double elapsed_seconds;
    long long invocation_count;
    long long input_count;
    long long output_count;

    SearchMetric()
        : elapsed_seconds(0.0), invocation_count(0), input_count(0), output_count(0)
    {}

    SearchMetric(double elapsed, long long invocations, long long inputs, long long outputs)
        : elapsed_seconds(elapsed), invocation_count(invocations),
          input_count(inputs), output_count(outputs)
    {}

    bool operator==(const SearchMetric& other) const {
        return elapsed_seconds == other.elapsed_seconds
            && invocation_count == other.invocation_count
            && input_count == other.input_count
            && output_count == other.output_count;
    }

    bool operator!=(const SearchMetric& other) const { return !(*this == other); }
};

/**
 * Severity of an inspector message
 */
enum class MessageSeverity {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

/**
 * How a chunk is flushed
 */
enum class FlushMode {
    CONTINUE,   // Intermediate chunk, session goes on
    PARTIAL,    // Intermediate result set
    FINISHED    // Last chunk of the session
};

// ============================================================================
// Exceptions
// ============================================================================

/**
 * Caller broke the protocol contract (bad flush flags, use after finish)
 */
class ContractError : public std::logic_error {
public:
    explicit ContractError(const std::string& what) : std::logic_error(what) {}
};

/**
 * Operation called before a mode was selected
 */
class NotConfiguredError : public ContractError {
public:
    explicit NotConfiguredError(const std::string& what) : ContractError(what) {}
};

/**
 * Metadata text could not be decoded
 */
class MetadataParseError : public std::runtime_error {
public:
    MetadataParseError(const std::string& what, std::size_t offset);

    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

/**
 * Value could not be encoded (e.g. string is not valid UTF-8)
 */
class MetadataEncodeError : public std::runtime_error {
public:
    explicit MetadataEncodeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Chunk framing on the wire is malformed or truncated
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Underlying stream or recording file failed
 */
class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Replayed session diverged from its recording
 */
class RecordingMismatchError : public std::runtime_error {
public:
    explicit RecordingMismatchError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// Utilities
// ============================================================================

class Utils {
public:
    /**
     * Severity name as it appears on the wire ("debug", "info", ...)
     */
    static std::string severity_name(MessageSeverity severity);

    /**
     * Parse a severity name (case-insensitive)
     * @throws ContractError for an unknown name
     */
    static MessageSeverity parse_severity(const std::string& name);

    /**
     * Flush mode name for logging
     */
    static std::string flush_mode_name(FlushMode mode);

    /**
     * Replace each "{}" with the next argument; "{{" and "}}" are literal braces
     * @throws ContractError when placeholders and arguments do not match
     */
    static std::string format_message(const std::string& format,
                                      const std::vector<std::string>& args);
};

} // namespace chunked

#endif // CHUNKED_COMMON_HPP
