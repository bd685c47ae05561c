/**
 * Emit Chunks
 *
 * Writes synthetic records to stdout in the chunked record protocol, the way
 * a command process answers its host. Optionally tee-records the output to a
 * gzip recording for later replay.
 *
 * Usage:
 *   ./emit_chunks -n 31 -m 10
 *   ./emit_chunks -n 1000 -m 100 -r session.output.gz -v
 *   ./emit_chunks -n 5 --partial
 */

#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include "byte_stream.hpp"
#include "cli_utils.hpp"
#include "record_writer.hpp"
#include "recorder.hpp"

using chunked::ByteStream;
using chunked::FlushMode;
using chunked::Record;
using chunked::RecordWriter;
using chunked::Recorder;
using chunked::SearchMetric;
using chunked::StdByteStream;
using chunked::Value;
using chunked::cli::ArgumentParser;
using chunked::cli::Validator;

/**
 * Build the record for one serial number
 */
Record make_record(size_t serial) {
    Record record = Record::object();
    record["_serial"] = serial;
    record["_time"] = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    record["value"] = (serial % 7 == 0) ? std::nan("") : std::sqrt(static_cast<double>(serial));
    record["tags"] = Value::array({"even", serial % 2 == 0 ? "yes" : "no"});
    record["payload"] = {{"id", serial}, {"label", "record $" + std::to_string(serial)}};

    // Every tenth record reports an extra field
    if (serial % 10 == 9) {
        record["note"] = "checkpoint, " + std::to_string(serial);
    }

    return record;
}

int main(int argc, char* argv[]) {
    ArgumentParser parser("emit_chunks", "Write synthetic records as protocol chunks to stdout");

    parser.add_argument({"-n", "--records", "Number of records to write", false, true, "31", "COUNT"});
    parser.add_argument({"-m", "--maxresultrows", "Records per chunk", false, true, "10", "ROWS"});
    parser.add_argument({"-r", "--record", "Tee-record stdout to this gzip file", false, true, "", "FILE"});
    parser.add_argument({"", "--partial", "Mark the last chunk partial instead of finished", false, false, "", ""});
    parser.add_argument({"-v", "--verbose", "Log flushes to stderr", false, false, "", ""});

    if (!parser.parse(argc, argv)) {
        if (parser.help_requested()) {
            return 0;
        }
        for (const auto& error : parser.get_errors()) {
            std::cerr << "Error: " << error << std::endl;
        }
        return 1;
    }

    size_t record_count = 0;
    size_t maxresultrows = 0;
    std::string error;

    if (!Validator::parse_count(parser.get("-n"), record_count, &error)
        || !Validator::parse_count(parser.get("-m"), maxresultrows, &error)) {
        parser.print_error(error);
        return 1;
    }

    try {
        StdByteStream stdout_stream(std::cout);
        std::unique_ptr<Recorder> recorder;
        ByteStream* ofile = &stdout_stream;

        if (parser.has("-r")) {
            recorder = std::make_unique<Recorder>(parser.get("-r"), stdout_stream);
            ofile = recorder.get();
        }

        RecordWriter writer(*ofile, maxresultrows);
        writer.set_verbose(parser.has("-v"));

        auto start = std::chrono::steady_clock::now();

        for (size_t serial = 0; serial < record_count; serial++) {
            writer.write_record(make_record(serial));
        }

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        writer.write_info("Wrote {} records in {} chunks", record_count, writer.chunk_count());
        writer.write_metric("emit_chunks", SearchMetric(elapsed, 1,
                                                        static_cast<long long>(record_count),
                                                        static_cast<long long>(record_count)));

        writer.flush(parser.has("--partial") ? FlushMode::PARTIAL : FlushMode::FINISHED);

        if (recorder) {
            recorder->close();
            std::cerr << "[RECORDER] Saved " << recorder->mirror().size() << " bytes to "
                      << recorder->recording_path() << std::endl;
        }

        std::cerr << "Committed " << writer.committed_record_count() << " records in "
                  << writer.chunk_count() << " chunks" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
