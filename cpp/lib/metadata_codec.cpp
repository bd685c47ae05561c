/**
 * Metadata Codec - Implementation
 */

#include "metadata_codec.hpp"
#include <cmath>
#include <cstring>
#include <limits>

namespace chunked {

// ============================================================================
// MetadataEncoder Implementation
// ============================================================================

std::string MetadataEncoder::encode(const Value& value) const {
    std::string out;
    encode_value(value, out, 0);
    return out;
}

void MetadataEncoder::encode(const Value& value, std::string& out) const {
    encode_value(value, out, 0);
}

std::string MetadataEncoder::encode_float(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }

    // nlohmann/json writes the shortest form that parses back to the same
    // double and always keeps a fraction or exponent
    return Value(value).dump();
}

std::string MetadataEncoder::encode_string(const std::string& str) {
    try {
        return Value(str).dump();
    } catch (const Value::type_error& e) {
        throw MetadataEncodeError(std::string("Cannot encode string: ") + e.what());
    }
}

void MetadataEncoder::check_text(const std::string& text) {
    encode_string(text);
}

void MetadataEncoder::encode_value(const Value& value, std::string& out, int depth) const {
    if (depth > MetadataDecoder::kMaxDepth) {
        throw MetadataEncodeError("Value nested too deeply");
    }

    switch (value.type()) {
        case Value::value_t::object: {
            out += '{';
            bool first = true;
            for (auto it = value.begin(); it != value.end(); ++it) {
                if (!first) out += ',';
                first = false;
                out += encode_string(it.key());
                out += ':';
                encode_value(it.value(), out, depth + 1);
            }
            out += '}';
            break;
        }

        case Value::value_t::array: {
            out += '[';
            bool first = true;
            for (const auto& element : value) {
                if (!first) out += ',';
                first = false;
                encode_value(element, out, depth + 1);
            }
            out += ']';
            break;
        }

        case Value::value_t::string:
            out += encode_string(value.get_ref<const std::string&>());
            break;

        case Value::value_t::number_float:
            out += encode_float(value.get<double>());
            break;

        case Value::value_t::boolean:
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::null:
            out += value.dump();
            break;

        case Value::value_t::binary:
        case Value::value_t::discarded:
            throw MetadataEncodeError("Value type cannot be encoded as metadata");
    }
}

// ============================================================================
// MetadataDecoder Implementation
// ============================================================================

Value MetadataDecoder::decode(const std::string& text) const {
    Cursor cursor{text, 0};

    Value result = parse_value(cursor, 0);

    skip_whitespace(cursor);
    if (cursor.pos != text.size()) {
        throw MetadataParseError("Unexpected trailing characters", cursor.pos);
    }

    return result;
}

void MetadataDecoder::skip_whitespace(Cursor& cursor) const {
    const std::string& text = cursor.text;
    while (cursor.pos < text.size()) {
        char c = text[cursor.pos];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        cursor.pos++;
    }
}

void MetadataDecoder::expect_literal(Cursor& cursor, const char* literal) const {
    size_t length = std::strlen(literal);
    if (cursor.text.compare(cursor.pos, length, literal) != 0) {
        throw MetadataParseError(std::string("Expected '") + literal + "'", cursor.pos);
    }
    cursor.pos += length;
}

Value MetadataDecoder::parse_value(Cursor& cursor, int depth) const {
    if (depth > kMaxDepth) {
        throw MetadataParseError("Nesting too deep", cursor.pos);
    }

    skip_whitespace(cursor);
    if (cursor.pos >= cursor.text.size()) {
        throw MetadataParseError("Unexpected end of input", cursor.pos);
    }

    char c = cursor.text[cursor.pos];
    switch (c) {
        case '{': return parse_object(cursor, depth);
        case '[': return parse_array(cursor, depth);
        case '"': return Value(parse_string(cursor));
        case 't': expect_literal(cursor, "true");  return Value(true);
        case 'f': expect_literal(cursor, "false"); return Value(false);
        case 'n': expect_literal(cursor, "null");  return Value(nullptr);
        case 'N':
            expect_literal(cursor, "NaN");
            return Value(std::numeric_limits<double>::quiet_NaN());
        case 'I':
            expect_literal(cursor, "Infinity");
            return Value(std::numeric_limits<double>::infinity());
        case '-':
            if (cursor.pos + 1 < cursor.text.size() && cursor.text[cursor.pos + 1] == 'I') {
                expect_literal(cursor, "-Infinity");
                return Value(-std::numeric_limits<double>::infinity());
            }
            return parse_number(cursor);
        default:
            if (c >= '0' && c <= '9') {
                return parse_number(cursor);
            }
            throw MetadataParseError(std::string("Unexpected character '") + c + "'", cursor.pos);
    }
}

Value MetadataDecoder::parse_object(Cursor& cursor, int depth) const {
    Value object = Value::object();
    cursor.pos++;  // '{'

    skip_whitespace(cursor);
    if (cursor.pos < cursor.text.size() && cursor.text[cursor.pos] == '}') {
        cursor.pos++;
        return object;
    }

    while (true) {
        skip_whitespace(cursor);
        if (cursor.pos >= cursor.text.size() || cursor.text[cursor.pos] != '"') {
            throw MetadataParseError("Expected object key", cursor.pos);
        }
        std::string key = parse_string(cursor);

        skip_whitespace(cursor);
        if (cursor.pos >= cursor.text.size() || cursor.text[cursor.pos] != ':') {
            throw MetadataParseError("Expected ':'", cursor.pos);
        }
        cursor.pos++;

        object[key] = parse_value(cursor, depth + 1);

        skip_whitespace(cursor);
        if (cursor.pos >= cursor.text.size()) {
            throw MetadataParseError("Unterminated object", cursor.pos);
        }

        char c = cursor.text[cursor.pos++];
        if (c == '}') {
            return object;
        }
        if (c != ',') {
            throw MetadataParseError("Expected ',' or '}'", cursor.pos - 1);
        }
    }
}

Value MetadataDecoder::parse_array(Cursor& cursor, int depth) const {
    Value array = Value::array();
    cursor.pos++;  // '['

    skip_whitespace(cursor);
    if (cursor.pos < cursor.text.size() && cursor.text[cursor.pos] == ']') {
        cursor.pos++;
        return array;
    }

    while (true) {
        array.push_back(parse_value(cursor, depth + 1));

        skip_whitespace(cursor);
        if (cursor.pos >= cursor.text.size()) {
            throw MetadataParseError("Unterminated array", cursor.pos);
        }

        char c = cursor.text[cursor.pos++];
        if (c == ']') {
            return array;
        }
        if (c != ',') {
            throw MetadataParseError("Expected ',' or ']'", cursor.pos - 1);
        }
    }
}

std::string MetadataDecoder::parse_string(Cursor& cursor) const {
    const std::string& text = cursor.text;
    size_t start = cursor.pos;
    size_t i = start + 1;

    // Find the closing quote; escapes are validated by nlohmann/json below
    while (i < text.size() && text[i] != '"') {
        i += (text[i] == '\\') ? 2 : 1;
    }
    if (i >= text.size()) {
        throw MetadataParseError("Unterminated string", start);
    }

    cursor.pos = i + 1;

    try {
        return Value::parse(text.begin() + start, text.begin() + i + 1).get<std::string>();
    } catch (const Value::parse_error& e) {
        throw MetadataParseError(std::string("Invalid string: ") + e.what(), start);
    }
}

Value MetadataDecoder::parse_number(Cursor& cursor) const {
    const std::string& text = cursor.text;
    size_t start = cursor.pos;
    size_t i = start;

    while (i < text.size()) {
        char c = text[i];
        if ((c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E') {
            i++;
        } else {
            break;
        }
    }

    cursor.pos = i;

    try {
        return Value::parse(text.begin() + start, text.begin() + i);
    } catch (const Value::parse_error& e) {
        throw MetadataParseError(std::string("Invalid number: ") + e.what(), start);
    }
}

} // namespace chunked
