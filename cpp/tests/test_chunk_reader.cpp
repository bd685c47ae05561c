#include <catch2/catch.hpp>
#include "chunk_reader.hpp"
#include <string>

using namespace chunked;

TEST_CASE("frame_chunk writes the header line") {
    REQUIRE(frame_chunk("{}", "") == "chunked 1.0,2,0\n{}");
    REQUIRE(frame_chunk("{\"finished\":true}", "a,b\r\n") == "chunked 1.0,17,5\n{\"finished\":true}a,b\r\n");
}

TEST_CASE("chunk header parsing") {
    ChunkHeader header = parse_chunk_header("chunked 1.0,123,4567\n");
    REQUIRE(header.metadata_length == 123);
    REQUIRE(header.body_length == 4567);

    REQUIRE_THROWS_AS(parse_chunk_header(""), ProtocolError);
    REQUIRE_THROWS_AS(parse_chunk_header("chunked 1.0,1,2"), ProtocolError);
    REQUIRE_THROWS_AS(parse_chunk_header("chunked 2.0,1,2\n"), ProtocolError);
    REQUIRE_THROWS_AS(parse_chunk_header("chunked 1.0,1\n"), ProtocolError);
    REQUIRE_THROWS_AS(parse_chunk_header("chunked 1.0,,2\n"), ProtocolError);
    REQUIRE_THROWS_AS(parse_chunk_header("chunked 1.0,1,2,3\n"), ProtocolError);
    REQUIRE_THROWS_AS(parse_chunk_header("chunked 1.0,-1,2\n"), ProtocolError);
    REQUIRE_THROWS_AS(parse_chunk_header("chunked 1.0,99999999999999999999999,2\n"), ProtocolError);
}

TEST_CASE("reader returns chunks in order") {
    MemoryByteStream stream(frame_chunk("{\"n\":1}", "body one")
                            + frame_chunk("", "")
                            + frame_chunk("{\"n\":3,\"x\":NaN}", ""));
    ChunkReader reader(stream);

    auto first = reader.read_chunk();
    REQUIRE(first.has_value());
    REQUIRE(first->metadata["n"] == 1);
    REQUIRE(first->body == "body one");

    auto second = reader.read_chunk();
    REQUIRE(second.has_value());
    REQUIRE(second->metadata.is_object());
    REQUIRE(second->metadata.empty());
    REQUIRE(second->body.empty());

    auto third = reader.read_chunk();
    REQUIRE(third.has_value());
    REQUIRE(third->metadata["n"] == 3);

    REQUIRE_FALSE(reader.read_chunk().has_value());
    REQUIRE(reader.get_chunk_count() == 3);
}

TEST_CASE("reader rejects truncated chunks") {
    SECTION("metadata cut short") {
        MemoryByteStream stream("chunked 1.0,10,0\n{\"a\":");
        ChunkReader reader(stream);
        REQUIRE_THROWS_AS(reader.read_chunk(), ProtocolError);
    }

    SECTION("body cut short") {
        MemoryByteStream stream("chunked 1.0,2,10\n{}abc");
        ChunkReader reader(stream);
        REQUIRE_THROWS_AS(reader.read_chunk(), ProtocolError);
    }

    SECTION("header without newline") {
        MemoryByteStream stream("chunked 1.0,2");
        ChunkReader reader(stream);
        REQUIRE_THROWS_AS(reader.read_all(), ProtocolError);
    }

    SECTION("garbage between chunks") {
        MemoryByteStream stream(frame_chunk("{}", "") + "garbage\n");
        ChunkReader reader(stream);
        REQUIRE_THROWS_AS(reader.read_all(), ProtocolError);
        REQUIRE(reader.get_chunk_count() == 1);
    }
}

TEST_CASE("reader surfaces undecodable metadata") {
    MemoryByteStream stream(frame_chunk("{bad}", ""));
    ChunkReader reader(stream);

    REQUIRE_THROWS_AS(reader.read_chunk(), MetadataParseError);
}
