/**
 * Byte Streams
 *
 * Abstract read/readline/write handle used by the record writer, the chunk
 * reader and the tee recorder. A stream is owned by the caller and passed
 * by reference; it is never shared between two writers.
 */

#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

#include <string>
#include <cstddef>
#include <istream>
#include <ostream>

namespace chunked {

/**
 * Byte stream interface
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * Read up to size bytes
     * @param size Maximum bytes to read (-1 reads to end of stream)
     * @return Bytes read; empty at end of stream
     */
    virtual std::string read(std::ptrdiff_t size = -1) = 0;

    /**
     * Read one line including its trailing '\n'
     * @param size Maximum bytes to read (-1 for no limit)
     * @return Line read; empty at end of stream
     */
    virtual std::string readline(std::ptrdiff_t size = -1) = 0;

    /**
     * Write all bytes of data
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Push written bytes to the underlying device
     */
    virtual void flush() {}
};

/**
 * In-memory byte stream
 *
 * Reads and writes share a single position, so a stream constructed with
 * content reads it back and a default-constructed one collects writes.
 */
class MemoryByteStream : public ByteStream {
public:
    MemoryByteStream();
    explicit MemoryByteStream(const std::string& content);

    std::string read(std::ptrdiff_t size = -1) override;
    std::string readline(std::ptrdiff_t size = -1) override;
    void write(const std::string& data) override;

    /**
     * Entire buffer regardless of position
     */
    const std::string& getvalue() const;

    size_t tell() const;
    void seek(size_t position);

    /**
     * Drop all content and rewind
     */
    void clear();

private:
    std::string buffer_;
    size_t position_;
};

/**
 * Adapter over standard iostreams (e.g. std::cin / std::cout)
 */
class StdByteStream : public ByteStream {
public:
    explicit StdByteStream(std::istream& in);
    explicit StdByteStream(std::ostream& out);
    StdByteStream(std::istream& in, std::ostream& out);

    std::string read(std::ptrdiff_t size = -1) override;
    std::string readline(std::ptrdiff_t size = -1) override;
    void write(const std::string& data) override;
    void flush() override;

private:
    std::istream* in_;
    std::ostream* out_;

    std::istream& input();
    std::ostream& output();
};

} // namespace chunked

#endif // BYTE_STREAM_HPP
