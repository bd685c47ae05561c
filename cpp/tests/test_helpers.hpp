/**
 * Shared test helpers
 */

#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "byte_stream.hpp"
#include "chunked_common.hpp"
#include <filesystem>
#include <string>

namespace chunked {
namespace test {

namespace fs = std::filesystem;

/**
 * Fresh path under a per-suite temp directory; any old file is removed
 */
inline fs::path temp_file(const std::string& suite, const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("chunked_" + suite);
    fs::create_directories(dir);
    fs::path path = dir / name;
    fs::remove(path);
    return path;
}

/**
 * Stream whose writes fail after a number of successful calls
 */
class FailingByteStream : public MemoryByteStream {
public:
    explicit FailingByteStream(int writes_allowed) : writes_allowed_(writes_allowed) {}

    void write(const std::string& data) override {
        if (writes_allowed_ <= 0) {
            throw StreamError("Broken pipe");
        }
        writes_allowed_--;
        MemoryByteStream::write(data);
    }

    void allow_writes(int count) { writes_allowed_ = count; }

private:
    int writes_allowed_;
};

} // namespace test
} // namespace chunked

#endif // TEST_HELPERS_HPP
