#include <catch2/catch.hpp>
#include "chunk_reader.hpp"
#include "record_writer.hpp"
#include "recorder.hpp"
#include "test_helpers.hpp"
#include <string>

using namespace chunked;
using chunked::test::temp_file;

TEST_CASE("recorder passes reads through and records them") {
    std::string path = temp_file("recorder", "input.gz").string();
    MemoryByteStream source("header line\nblock of bytes");
    std::string observed;

    {
        Recorder recorder(path, source);

        observed += recorder.readline();
        observed += recorder.read(5);
        observed += recorder.read();
        observed += recorder.read();

        REQUIRE(observed == "header line\nblock of bytes");
        REQUIRE(recorder.mirror() == observed);
    }

    REQUIRE(load_recording(path) == observed);
}

TEST_CASE("recorder passes writes through and records them") {
    std::string path = temp_file("recorder", "output.gz").string();
    MemoryByteStream sink;
    Recorder recorder(path, sink);

    recorder.write("first ");
    recorder.write("");
    recorder.write(std::string("second\0third", 12));
    recorder.flush();

    REQUIRE(sink.getvalue() == std::string("first second\0third", 18));
    REQUIRE(recorder.mirror() == sink.getvalue());

    recorder.close();
    REQUIRE(recorder.is_closed());
    REQUIRE(load_recording(path) == recorder.mirror());
}

TEST_CASE("recorder keeps reads and writes in call order") {
    std::string path = temp_file("recorder", "duplex.gz").string();
    MemoryByteStream stream("request\n");
    Recorder recorder(path, stream);

    std::string line = recorder.readline();
    recorder.write("response\n");
    recorder.close();

    REQUIRE(line == "request\n");
    REQUIRE(stream.getvalue() == "request\nresponse\n");
    REQUIRE(load_recording(path) == "request\nresponse\n");
}

TEST_CASE("recorder wraps a record writer destination") {
    std::string path = temp_file("recorder", "session.gz").string();
    MemoryByteStream sink;
    Recorder recorder(path, sink);

    RecordWriter writer(recorder, 3);
    for (int i = 0; i < 7; i++) {
        writer.write_record({{"n", i}});
    }
    writer.write_info("done");
    writer.flush(FlushMode::FINISHED);
    recorder.close();

    std::string recorded = load_recording(path);
    REQUIRE(recorded == sink.getvalue());

    MemoryByteStream replay(recorded);
    ChunkReader reader(replay);
    REQUIRE(reader.read_all().size() == 3);
}

TEST_CASE("recorder rejects use after close") {
    std::string path = temp_file("recorder", "closed.gz").string();
    MemoryByteStream stream("data");
    Recorder recorder(path, stream);

    recorder.close();
    recorder.close();

    REQUIRE_THROWS_AS(recorder.read(), StreamError);
    REQUIRE_THROWS_AS(recorder.readline(), StreamError);
    REQUIRE_THROWS_AS(recorder.write("x"), StreamError);
    REQUIRE_THROWS_AS(recorder.flush(), StreamError);
}

TEST_CASE("recording file errors") {
    MemoryByteStream stream;
    std::string missing_dir = (temp_file("recorder", "no_such_dir") / "out.gz").string();

    REQUIRE_THROWS_AS(Recorder(missing_dir, stream), StreamError);
    REQUIRE_THROWS_AS(load_recording(missing_dir), StreamError);
    REQUIRE_THROWS_AS(save_recording(missing_dir, "data"), StreamError);
}

TEST_CASE("save and load recording") {
    std::string path = temp_file("recorder", "saved.gz").string();
    std::string data(100000, 'x');
    data += "tail";

    save_recording(path, data);
    REQUIRE(load_recording(path) == data);
}
