/**
 * Tee Recorder
 *
 * Wraps a byte stream. Every read, readline and write passes through to the
 * wrapped stream unchanged, and the bytes observed are appended both to an
 * in-memory mirror and to a gzip-compressed recording file. Decompressing a
 * closed recording reproduces the mirror exactly.
 */

#ifndef RECORDER_HPP
#define RECORDER_HPP

#include "byte_stream.hpp"
#include <string>
#include <zlib.h>

namespace chunked {

/**
 * Tee recorder for one stream
 */
class Recorder : public ByteStream {
public:
    /**
     * Constructor - opens the recording file
     * @param recording_path Path of the gzip recording (truncated if present)
     * @param stream Wrapped stream (not owned)
     * @throws StreamError if the recording cannot be opened
     */
    Recorder(const std::string& recording_path, ByteStream& stream);

    /**
     * Destructor - closes the recording
     */
    ~Recorder() override;

    // Non-copyable
    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    std::string read(std::ptrdiff_t size = -1) override;
    std::string readline(std::ptrdiff_t size = -1) override;
    void write(const std::string& data) override;

    /**
     * Flush the wrapped stream and sync the recording
     */
    void flush() override;

    /**
     * Flush and close the recording file
     * @throws StreamError if the recording cannot be completed
     */
    void close();

    bool is_closed() const;

    /**
     * Bytes observed so far, in call order
     */
    const std::string& mirror() const;

    const std::string& recording_path() const;

    /**
     * Wrapped stream
     */
    ByteStream& stream();

private:
    ByteStream& stream_;
    std::string recording_path_;
    gzFile recording_;
    std::string mirror_;

    void require_open() const;
    void record(const std::string& data);
};

/**
 * Decompress a recording file
 * @throws StreamError if the file cannot be read
 */
std::string load_recording(const std::string& path);

/**
 * Write data as a gzip recording file
 * @throws StreamError if the file cannot be written
 */
void save_recording(const std::string& path, const std::string& data);

} // namespace chunked

#endif // RECORDER_HPP
