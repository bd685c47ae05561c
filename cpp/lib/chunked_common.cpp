/**
 * Chunked Protocol Common Utilities - Implementation
 */

#include "chunked_common.hpp"
#include <algorithm>
#include <cctype>

namespace chunked {

MetadataParseError::MetadataParseError(const std::string& what, std::size_t offset)
    : std::runtime_error(what + " at offset " + std::to_string(offset)),
      offset_(offset) {
}

// ============================================================================
// Utils Implementation
// ============================================================================

std::string Utils::severity_name(MessageSeverity severity) {
    switch (severity) {
        case MessageSeverity::DEBUG: return "debug";
        case MessageSeverity::INFO:  return "info";
        case MessageSeverity::WARN:  return "warn";
        case MessageSeverity::ERROR: return "error";
        case MessageSeverity::FATAL: return "fatal";
    }
    throw ContractError("Unknown message severity");
}

MessageSeverity Utils::parse_severity(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return MessageSeverity::DEBUG;
    if (lower == "info") return MessageSeverity::INFO;
    if (lower == "warn" || lower == "warning") return MessageSeverity::WARN;
    if (lower == "error") return MessageSeverity::ERROR;
    if (lower == "fatal") return MessageSeverity::FATAL;

    throw ContractError("Unknown message severity: " + name);
}

std::string Utils::flush_mode_name(FlushMode mode) {
    switch (mode) {
        case FlushMode::CONTINUE: return "continue";
        case FlushMode::PARTIAL:  return "partial";
        case FlushMode::FINISHED: return "finished";
    }
    return "unknown";
}

std::string Utils::format_message(const std::string& format,
                                  const std::vector<std::string>& args) {
    std::string result;
    result.reserve(format.size());

    size_t next_arg = 0;
    for (size_t i = 0; i < format.size(); i++) {
        char c = format[i];

        if (c == '{') {
            if (i + 1 < format.size() && format[i + 1] == '{') {
                result += '{';
                i++;
            } else if (i + 1 < format.size() && format[i + 1] == '}') {
                if (next_arg >= args.size()) {
                    throw ContractError("Too few arguments for message format: " + format);
                }
                result += args[next_arg++];
                i++;
            } else {
                throw ContractError("Unmatched '{' in message format: " + format);
            }
        } else if (c == '}') {
            if (i + 1 < format.size() && format[i + 1] == '}') {
                result += '}';
                i++;
            } else {
                throw ContractError("Unmatched '}' in message format: " + format);
            }
        } else {
            result += c;
        }
    }

    if (next_arg != args.size()) {
        throw ContractError("Too many arguments for message format: " + format);
    }

    return result;
}

} // namespace chunked
