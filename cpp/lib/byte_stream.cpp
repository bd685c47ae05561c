/**
 * Byte Streams - Implementation
 */

#include "byte_stream.hpp"
#include "chunked_common.hpp"
#include <algorithm>
#include <iterator>
#include <vector>

namespace chunked {

// ============================================================================
// MemoryByteStream Implementation
// ============================================================================

MemoryByteStream::MemoryByteStream()
    : position_(0) {
}

MemoryByteStream::MemoryByteStream(const std::string& content)
    : buffer_(content), position_(0) {
}

std::string MemoryByteStream::read(std::ptrdiff_t size) {
    if (position_ >= buffer_.size()) {
        return "";
    }

    size_t available = buffer_.size() - position_;
    size_t count = (size < 0) ? available : std::min(available, static_cast<size_t>(size));

    std::string result = buffer_.substr(position_, count);
    position_ += count;
    return result;
}

std::string MemoryByteStream::readline(std::ptrdiff_t size) {
    if (position_ >= buffer_.size()) {
        return "";
    }

    size_t end = buffer_.find('\n', position_);
    end = (end == std::string::npos) ? buffer_.size() : end + 1;

    if (size >= 0) {
        end = std::min(end, position_ + static_cast<size_t>(size));
    }

    std::string result = buffer_.substr(position_, end - position_);
    position_ = end;
    return result;
}

void MemoryByteStream::write(const std::string& data) {
    if (position_ > buffer_.size()) {
        buffer_.resize(position_, '\0');
    }

    // Overwrite in place, extending the buffer past its end
    size_t overlap = std::min(data.size(), buffer_.size() - position_);
    buffer_.replace(position_, overlap, data);
    position_ += data.size();
}

const std::string& MemoryByteStream::getvalue() const {
    return buffer_;
}

size_t MemoryByteStream::tell() const {
    return position_;
}

void MemoryByteStream::seek(size_t position) {
    position_ = position;
}

void MemoryByteStream::clear() {
    buffer_.clear();
    position_ = 0;
}

// ============================================================================
// StdByteStream Implementation
// ============================================================================

StdByteStream::StdByteStream(std::istream& in)
    : in_(&in), out_(nullptr) {
}

StdByteStream::StdByteStream(std::ostream& out)
    : in_(nullptr), out_(&out) {
}

StdByteStream::StdByteStream(std::istream& in, std::ostream& out)
    : in_(&in), out_(&out) {
}

std::istream& StdByteStream::input() {
    if (!in_) {
        throw StreamError("Stream is not readable");
    }
    return *in_;
}

std::ostream& StdByteStream::output() {
    if (!out_) {
        throw StreamError("Stream is not writable");
    }
    return *out_;
}

std::string StdByteStream::read(std::ptrdiff_t size) {
    std::istream& in = input();

    if (size < 0) {
        std::string result((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw StreamError("Read failed");
        }
        return result;
    }

    std::vector<char> buffer(static_cast<size_t>(size));
    in.read(buffer.data(), size);
    if (in.bad()) {
        throw StreamError("Read failed");
    }

    return std::string(buffer.data(), static_cast<size_t>(in.gcount()));
}

std::string StdByteStream::readline(std::ptrdiff_t size) {
    std::istream& in = input();
    std::string line;
    char c;

    while ((size < 0 || static_cast<std::ptrdiff_t>(line.size()) < size) && in.get(c)) {
        line += c;
        if (c == '\n') {
            break;
        }
    }

    if (in.bad()) {
        throw StreamError("Read failed");
    }

    return line;
}

void StdByteStream::write(const std::string& data) {
    std::ostream& out = output();
    out.write(data.data(), static_cast<std::streamsize>(data.size()));

    if (!out) {
        throw StreamError("Write failed");
    }
}

void StdByteStream::flush() {
    if (out_) {
        out_->flush();
        if (!*out_) {
            throw StreamError("Flush failed");
        }
    }
}

} // namespace chunked
