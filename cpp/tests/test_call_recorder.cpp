#include <catch2/catch.hpp>
#include "call_recorder.hpp"
#include "metadata_codec.hpp"
#include "record_writer.hpp"
#include "recorder.hpp"
#include "test_helpers.hpp"
#include <string>

using namespace chunked;
using chunked::test::temp_file;

namespace {

/**
 * Two-part session: fetch a batch per part, write its rows, finish
 */
void run_session(CallRecorder& recorder, int& calls, int extra_rows = 0) {
    RecordWriter writer(recorder.output(), 2);

    auto fetch = [&calls]() {
        calls++;
        Value batch = Value::array();
        for (int i = 0; i < 3; i++) {
            Value row = Value::object();
            row["call"] = calls;
            row["row"] = i;
            batch.push_back(row);
        }
        return batch;
    };

    for (int part = 0; part < 2; part++) {
        if (part > 0) {
            recorder.next_part();
        }

        Value batch = recorder.get("search.fetch", fetch);
        for (const auto& record : batch) {
            writer.write_record(record);
        }

        Value limit = recorder.get("search.limit", []() { return Value(100); });
        writer.write_info("part {} limit {}", part, limit.get<int>());
    }

    for (int i = 0; i < extra_rows; i++) {
        writer.write_record({{"extra", i}});
    }

    writer.flush(FlushMode::FINISHED);
    recorder.stop();
}

} // namespace

TEST_CASE("uninitialized recorder only accepts mode selection") {
    CallRecorder recorder;

    REQUIRE(recorder.mode_name() == "uninitialized");
    REQUIRE_THROWS_AS(recorder.get("site", []() { return Value(1); }), NotConfiguredError);
    REQUIRE_THROWS_AS(recorder.next_part(), NotConfiguredError);
    REQUIRE_THROWS_AS(recorder.stop(), NotConfiguredError);
    REQUIRE_THROWS_AS(recorder.output(), NotConfiguredError);
}

TEST_CASE("mode is selected once") {
    std::string path = temp_file("call_recorder", "once.gz").string();
    CallRecorder recorder;

    recorder.select_live(path);
    REQUIRE(recorder.mode_name() == "live");

    REQUIRE_THROWS_AS(recorder.select_live(path), ContractError);
    REQUIRE_THROWS_AS(recorder.select_replay(path), ContractError);
    REQUIRE(recorder.mode_name() == "live");
}

TEST_CASE("live session replays to identical output") {
    std::string path = temp_file("call_recorder", "session.gz").string();

    CallRecorder live;
    live.select_live(path);
    int live_calls = 0;
    run_session(live, live_calls);
    REQUIRE(live_calls == 2);

    CallRecorder replay;
    replay.select_replay(path);
    REQUIRE(replay.mode_name() == "replay");
    int replay_calls = 0;
    REQUIRE_NOTHROW(run_session(replay, replay_calls));

    // Results come from the recording, not from the calls
    REQUIRE(replay_calls == 0);
    REQUIRE(replay.output().getvalue() == live.output().getvalue());
}

TEST_CASE("replay detects changed output") {
    std::string path = temp_file("call_recorder", "changed.gz").string();

    CallRecorder live;
    live.select_live(path);
    int calls = 0;
    run_session(live, calls);

    CallRecorder replay;
    replay.select_replay(path);
    REQUIRE_THROWS_AS(run_session(replay, calls, 1), RecordingMismatchError);
}

TEST_CASE("replay detects an altered recording") {
    std::string path = temp_file("call_recorder", "altered.gz").string();

    CallRecorder live;
    live.select_live(path);
    int calls = 0;
    run_session(live, calls);

    MetadataDecoder decoder;
    MetadataEncoder encoder;
    Value recording = decoder.decode(load_recording(path));
    recording["inputs"][0]["search.limit"][0] = 50;
    save_recording(path, encoder.encode(recording));

    CallRecorder replay;
    replay.select_replay(path);
    REQUIRE_THROWS_AS(run_session(replay, calls), RecordingMismatchError);
}

TEST_CASE("replay runs out of recorded results") {
    std::string path = temp_file("call_recorder", "short.gz").string();

    CallRecorder live;
    live.select_live(path);
    live.get("site", []() { return Value("only"); });
    live.stop();

    CallRecorder replay;
    replay.select_replay(path);
    REQUIRE(replay.get("site", []() { return Value("ignored"); }) == "only");
    REQUIRE_THROWS_AS(replay.get("site", []() { return Value("ignored"); }), RecordingMismatchError);
    REQUIRE_THROWS_AS(replay.get("other", []() { return Value(); }), RecordingMismatchError);
    REQUIRE_THROWS_AS(replay.next_part(), RecordingMismatchError);
}

TEST_CASE("replay rejects files that are not call recordings") {
    std::string path = temp_file("call_recorder", "bogus.gz").string();
    save_recording(path, "[1,2,3]");

    CallRecorder recorder;
    REQUIRE_THROWS_AS(recorder.select_replay(path), RecordingMismatchError);
    REQUIRE(recorder.mode_name() == "uninitialized");

    std::string missing = temp_file("call_recorder", "missing.gz").string();
    REQUIRE_THROWS_AS(recorder.select_replay(missing), StreamError);
}
