/**
 * Chunk Framing and Reader
 *
 * Wire format of one chunk:
 *
 *   chunked 1.0,<metadata_length>,<body_length>\n
 *   <metadata_length bytes of codec-encoded JSON metadata>
 *   <body_length bytes of row data>
 *
 * frame_chunk() builds the bytes of a chunk; ChunkReader parses a stream of
 * chunks back into (metadata, body) pairs.
 */

#ifndef CHUNK_READER_HPP
#define CHUNK_READER_HPP

#include "byte_stream.hpp"
#include "chunked_common.hpp"
#include "metadata_codec.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chunked {

/**
 * Protocol version written in every chunk header
 */
constexpr const char* kChunkHeaderPrefix = "chunked 1.0,";

/**
 * One decoded chunk
 */
struct Chunk {
    Value metadata;
    std::string body;

    Chunk() : metadata(Value::object()) {}
};

/**
 * Lengths parsed from a header line
 */
struct ChunkHeader {
    size_t metadata_length;
    size_t body_length;

    ChunkHeader() : metadata_length(0), body_length(0) {}
};

/**
 * Build header line + metadata + body as one string
 */
std::string frame_chunk(const std::string& metadata, const std::string& body);

/**
 * Parse "chunked 1.0,<m>,<b>\n"
 * @throws ProtocolError if the line is not a chunk header
 */
ChunkHeader parse_chunk_header(const std::string& line);

/**
 * Chunk reader
 * Reads chunks one at a time from a byte stream
 */
class ChunkReader {
public:
    /**
     * Constructor
     * @param ifile Source stream (not owned)
     */
    explicit ChunkReader(ByteStream& ifile);

    /**
     * Read next chunk
     * @return Chunk, or empty at a clean end of stream
     * @throws ProtocolError on a malformed header or truncated block
     * @throws MetadataParseError on undecodable metadata
     */
    std::optional<Chunk> read_chunk();

    /**
     * Read chunks until end of stream
     */
    std::vector<Chunk> read_all();

    /**
     * Get number of chunks read
     */
    size_t get_chunk_count() const;

private:
    ByteStream& ifile_;
    MetadataDecoder decoder_;
    size_t chunk_count_;

    std::string read_exact(size_t length, const char* what);
};

} // namespace chunked

#endif // CHUNK_READER_HPP
