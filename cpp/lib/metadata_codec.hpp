/**
 * Metadata Codec
 *
 * Compact JSON encoder/decoder for chunk metadata. Extends JSON with the
 * bare tokens NaN, Infinity and -Infinity so that every IEEE-754 double
 * survives a round trip. All other values are plain JSON, and object keys
 * keep their order in both directions.
 */

#ifndef METADATA_CODEC_HPP
#define METADATA_CODEC_HPP

#include "chunked_common.hpp"
#include <string>

namespace chunked {

/**
 * Metadata encoder
 * Writes compact JSON (separators "," and ":")
 */
class MetadataEncoder {
public:
    /**
     * Encode value to compact JSON text
     * @throws MetadataEncodeError if a string is not valid UTF-8
     */
    std::string encode(const Value& value) const;

    /**
     * Append encoded value to out
     */
    void encode(const Value& value, std::string& out) const;

    /**
     * Text form of a double: shortest round-trip, or NaN / Infinity / -Infinity
     */
    static std::string encode_float(double value);

    /**
     * Check that text can be encoded as a metadata string
     * @throws MetadataEncodeError if text is not valid UTF-8
     */
    static void check_text(const std::string& text);

private:
    void encode_value(const Value& value, std::string& out, int depth) const;
    static std::string encode_string(const std::string& str);
};

/**
 * Metadata decoder
 * Accepts JSON plus the NaN, Infinity and -Infinity tokens
 */
class MetadataDecoder {
public:
    /**
     * Maximum nesting of objects and arrays
     */
    static constexpr int kMaxDepth = 512;

    /**
     * Decode text into a value
     * @throws MetadataParseError on malformed or truncated text
     */
    Value decode(const std::string& text) const;

private:
    struct Cursor {
        const std::string& text;
        size_t pos;
    };

    Value parse_value(Cursor& cursor, int depth) const;
    Value parse_object(Cursor& cursor, int depth) const;
    Value parse_array(Cursor& cursor, int depth) const;
    std::string parse_string(Cursor& cursor) const;
    Value parse_number(Cursor& cursor) const;
    void expect_literal(Cursor& cursor, const char* literal) const;
    void skip_whitespace(Cursor& cursor) const;
};

} // namespace chunked

#endif // METADATA_CODEC_HPP
