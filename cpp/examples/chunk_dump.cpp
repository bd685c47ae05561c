/**
 * Chunk Dump
 *
 * Reads a chunked record stream and prints one summary row per chunk,
 * followed by the inspector messages each chunk carried.
 *
 * Usage:
 *   ./emit_chunks -n 31 -m 10 > session.out
 *   ./chunk_dump -i session.out
 *   ./chunk_dump -i session.output.gz -z
 */

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include "byte_stream.hpp"
#include "chunk_reader.hpp"
#include "cli_utils.hpp"
#include "recorder.hpp"

using chunked::ByteStream;
using chunked::Chunk;
using chunked::ChunkReader;
using chunked::MemoryByteStream;
using chunked::StdByteStream;
using chunked::Value;
using chunked::cli::ArgumentParser;
using chunked::cli::StringUtils;
using chunked::cli::TableFormatter;
using chunked::cli::Validator;

namespace {

std::string flag_text(const Value& metadata, const char* key) {
    if (!metadata.contains(key)) {
        return "-";
    }
    return metadata[key].is_boolean() ? (metadata[key].get<bool>() ? "yes" : "no") : metadata[key].dump();
}

size_t message_count(const Value& metadata) {
    if (!metadata.contains("inspector") || !metadata["inspector"].contains("messages")) {
        return 0;
    }
    return metadata["inspector"]["messages"].size();
}

void print_messages(size_t index, const Value& metadata) {
    if (message_count(metadata) == 0) {
        return;
    }

    for (const auto& message : metadata["inspector"]["messages"]) {
        if (message.is_array() && message.size() == 2 && message[0].is_string() && message[1].is_string()) {
            std::cout << "  chunk " << index << " [" << message[0].get<std::string>() << "] "
                      << StringUtils::abbreviate(message[1].get<std::string>(), 100) << std::endl;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    ArgumentParser parser("chunk_dump", "Summarize the chunks of a chunked record stream");

    parser.add_argument({"-i", "--input", "Chunk stream file", true, true, "", "FILE"});
    parser.add_argument({"-z", "--gzip", "Input is a gzip recording", false, false, "", ""});

    if (!parser.parse(argc, argv)) {
        if (parser.help_requested()) {
            return 0;
        }
        for (const auto& error : parser.get_errors()) {
            std::cerr << "Error: " << error << std::endl;
        }
        return 1;
    }

    std::string input_path = parser.get("-i");
    std::string error;
    if (!Validator::is_valid_file(input_path, &error)) {
        parser.print_error(error);
        return 1;
    }

    // Recordings are small enough to decompress in memory
    bool gzip_input = parser.has("-z") || StringUtils::ends_with(input_path, ".gz");

    try {
        std::ifstream file;
        std::unique_ptr<ByteStream> source;

        if (gzip_input) {
            source = std::make_unique<MemoryByteStream>(chunked::load_recording(input_path));
        } else {
            file.open(input_path, std::ios::in | std::ios::binary);
            if (!file.is_open()) {
                std::cerr << "Error: Cannot open file: " << input_path << std::endl;
                return 1;
            }
            source = std::make_unique<StdByteStream>(file);
        }

        ChunkReader reader(*source);
        std::vector<Chunk> chunks = reader.read_all();

        TableFormatter table;
        table.set_headers({"chunk", "fields", "messages", "finished", "partial", "metadata", "body bytes"});
        table.set_alignment(0, "right");
        table.set_alignment(1, "right");
        table.set_alignment(2, "right");
        table.set_alignment(6, "right");

        for (size_t i = 0; i < chunks.size(); i++) {
            const Value& metadata = chunks[i].metadata;
            size_t fields = metadata.contains("fieldnames") ? metadata["fieldnames"].size() : 0;

            table.add_row({
                std::to_string(i + 1),
                std::to_string(fields),
                std::to_string(message_count(metadata)),
                flag_text(metadata, "finished"),
                flag_text(metadata, "partial"),
                StringUtils::abbreviate(metadata.dump(), 40),
                std::to_string(chunks[i].body.size())
            });
        }

        std::cout << table.to_string();

        for (size_t i = 0; i < chunks.size(); i++) {
            print_messages(i + 1, chunks[i].metadata);
        }

        std::cout << std::endl << reader.get_chunk_count() << " chunks" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
