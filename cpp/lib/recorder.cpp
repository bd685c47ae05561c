/**
 * Tee Recorder - Implementation
 */

#include "recorder.hpp"
#include "chunked_common.hpp"
#include <algorithm>
#include <iostream>
#include <vector>

namespace chunked {

namespace {

// gzwrite takes an unsigned length; large buffers go in pieces
constexpr size_t kMaxGzipWrite = 1u << 30;

void gzip_write_all(gzFile file, const std::string& data, const std::string& path) {
    size_t offset = 0;

    while (offset < data.size()) {
        size_t count = std::min(kMaxGzipWrite, data.size() - offset);
        int written = gzwrite(file, data.data() + offset, static_cast<unsigned>(count));

        if (written <= 0) {
            int errnum = 0;
            const char* message = gzerror(file, &errnum);
            throw StreamError("Cannot write recording " + path + ": " + (message ? message : "unknown error"));
        }

        offset += static_cast<size_t>(written);
    }
}

} // namespace

// ============================================================================
// Recorder Implementation
// ============================================================================

Recorder::Recorder(const std::string& recording_path, ByteStream& stream)
    : stream_(stream), recording_path_(recording_path), recording_(nullptr) {

    recording_ = gzopen(recording_path.c_str(), "wb");

    if (!recording_) {
        std::cerr << "[RECORDER] Error: Cannot open recording for writing: "
                  << recording_path << std::endl;
        throw StreamError("Cannot open recording for writing: " + recording_path);
    }
}

Recorder::~Recorder() {
    if (recording_) {
        if (gzclose(recording_) != Z_OK) {
            std::cerr << "[RECORDER] Error: Recording may be incomplete: "
                      << recording_path_ << std::endl;
        }
        recording_ = nullptr;
    }
}

void Recorder::require_open() const {
    if (!recording_) {
        throw StreamError("Recorder is closed: " + recording_path_);
    }
}

void Recorder::record(const std::string& data) {
    if (data.empty()) {
        return;
    }

    mirror_ += data;
    gzip_write_all(recording_, data, recording_path_);
}

std::string Recorder::read(std::ptrdiff_t size) {
    require_open();
    std::string data = stream_.read(size);
    record(data);
    return data;
}

std::string Recorder::readline(std::ptrdiff_t size) {
    require_open();
    std::string line = stream_.readline(size);
    record(line);
    return line;
}

void Recorder::write(const std::string& data) {
    require_open();
    stream_.write(data);
    record(data);
}

void Recorder::flush() {
    require_open();
    stream_.flush();

    if (gzflush(recording_, Z_SYNC_FLUSH) != Z_OK) {
        throw StreamError("Cannot flush recording: " + recording_path_);
    }
}

void Recorder::close() {
    if (!recording_) {
        return;
    }

    gzFile file = recording_;
    recording_ = nullptr;

    if (gzclose(file) != Z_OK) {
        throw StreamError("Cannot close recording: " + recording_path_);
    }
}

bool Recorder::is_closed() const {
    return recording_ == nullptr;
}

const std::string& Recorder::mirror() const {
    return mirror_;
}

const std::string& Recorder::recording_path() const {
    return recording_path_;
}

ByteStream& Recorder::stream() {
    return stream_;
}

// ============================================================================
// Recording Files
// ============================================================================

std::string load_recording(const std::string& path) {
    gzFile file = gzopen(path.c_str(), "rb");
    if (!file) {
        throw StreamError("Cannot open recording: " + path);
    }

    std::string data;
    std::vector<char> buffer(64 * 1024);

    while (true) {
        int count = gzread(file, buffer.data(), static_cast<unsigned>(buffer.size()));

        if (count < 0) {
            int errnum = 0;
            std::string message = gzerror(file, &errnum);
            gzclose(file);
            throw StreamError("Cannot read recording " + path + ": " + message);
        }
        if (count == 0) {
            break;
        }

        data.append(buffer.data(), static_cast<size_t>(count));
    }

    if (gzclose(file) != Z_OK) {
        throw StreamError("Cannot read recording " + path + ": truncated");
    }

    return data;
}

void save_recording(const std::string& path, const std::string& data) {
    gzFile file = gzopen(path.c_str(), "wb");
    if (!file) {
        throw StreamError("Cannot open recording for writing: " + path);
    }

    try {
        gzip_write_all(file, data, path);
    } catch (const StreamError&) {
        gzclose(file);
        throw;
    }

    if (gzclose(file) != Z_OK) {
        throw StreamError("Cannot close recording: " + path);
    }
}

} // namespace chunked
