/**
 * Chunk Framing and Reader - Implementation
 */

#include "chunk_reader.hpp"
#include <cstring>
#include <limits>

namespace chunked {

// ============================================================================
// Framing
// ============================================================================

std::string frame_chunk(const std::string& metadata, const std::string& body) {
    std::string chunk;
    chunk.reserve(32 + metadata.size() + body.size());

    chunk += kChunkHeaderPrefix;
    chunk += std::to_string(metadata.size());
    chunk += ',';
    chunk += std::to_string(body.size());
    chunk += '\n';
    chunk += metadata;
    chunk += body;

    return chunk;
}

namespace {

// Parse decimal digits in [pos, end); advances pos
size_t parse_length(const std::string& line, size_t& pos, size_t end) {
    size_t start = pos;
    size_t value = 0;

    while (pos < end && line[pos] >= '0' && line[pos] <= '9') {
        size_t digit = static_cast<size_t>(line[pos] - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            throw ProtocolError("Chunk length overflows: " + line);
        }
        value = value * 10 + digit;
        pos++;
    }

    if (pos == start) {
        throw ProtocolError("Malformed chunk header: " + line);
    }

    return value;
}

} // namespace

ChunkHeader parse_chunk_header(const std::string& line) {
    size_t prefix_length = std::strlen(kChunkHeaderPrefix);

    if (line.empty() || line.back() != '\n'
        || line.compare(0, prefix_length, kChunkHeaderPrefix) != 0) {
        throw ProtocolError("Malformed chunk header: " + line);
    }

    size_t end = line.size() - 1;
    size_t pos = prefix_length;

    ChunkHeader header;
    header.metadata_length = parse_length(line, pos, end);

    if (pos >= end || line[pos] != ',') {
        throw ProtocolError("Malformed chunk header: " + line);
    }
    pos++;

    header.body_length = parse_length(line, pos, end);

    if (pos != end) {
        throw ProtocolError("Malformed chunk header: " + line);
    }

    return header;
}

// ============================================================================
// ChunkReader Implementation
// ============================================================================

ChunkReader::ChunkReader(ByteStream& ifile)
    : ifile_(ifile), chunk_count_(0) {
}

size_t ChunkReader::get_chunk_count() const {
    return chunk_count_;
}

std::string ChunkReader::read_exact(size_t length, const char* what) {
    std::string data;
    data.reserve(length);

    while (data.size() < length) {
        std::string part = ifile_.read(static_cast<std::ptrdiff_t>(length - data.size()));
        if (part.empty()) {
            throw ProtocolError(std::string("Truncated chunk ") + what + ": expected "
                                + std::to_string(length) + " bytes, got "
                                + std::to_string(data.size()));
        }
        data += part;
    }

    return data;
}

std::optional<Chunk> ChunkReader::read_chunk() {
    std::string line = ifile_.readline();
    if (line.empty()) {
        return std::nullopt;
    }

    ChunkHeader header = parse_chunk_header(line);

    Chunk chunk;

    if (header.metadata_length > 0) {
        chunk.metadata = decoder_.decode(read_exact(header.metadata_length, "metadata"));
    }

    if (header.body_length > 0) {
        chunk.body = read_exact(header.body_length, "body");
    }

    chunk_count_++;
    return chunk;
}

std::vector<Chunk> ChunkReader::read_all() {
    std::vector<Chunk> chunks;

    while (auto chunk = read_chunk()) {
        chunks.push_back(std::move(*chunk));
    }

    return chunks;
}

} // namespace chunked
