#pragma once
// Buffered line reader over a chunk-producing decoder.
//
// Concrete readers (zlib, zstd, rapidgzip) only implement read_chunk().
// The rapidgzip reader lives in src/line_reader_backend.cpp, the only TU
// that includes rapidgzip headers; everything else sees this interface.

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace arsc {

enum class Compression { NONE, GZIP, ZSTD };

class LineReader {
public:
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;  // 1 MB

    virtual ~LineReader() = default;

    // Read one line (without trailing newline) into `line`. Returns false on EOF.
    // Decoder failures throw GenomeError(IOError).
    bool readline(std::string& line);

protected:
    LineReader() : buf_(CHUNK_SIZE) {}

    // Decode up to n bytes into buf. Returns 0 at end of stream.
    virtual size_t read_chunk(char* buf, size_t n) = 0;

private:
    bool refill();

    std::vector<char> buf_;
    size_t buf_pos_ = 0;
    size_t buf_used_ = 0;
    bool eof_ = false;
};

// Sniff magic bytes: 1f 8b = gzip, 28 b5 2f fd = zstd, anything else = plain.
// Throws GenomeError(IOError) if the file cannot be opened.
Compression detect_compression(const std::string& path);

// Open `path` for line reading, picking the decoder from its magic bytes.
// decoder_threads > 1 enables parallel gzip decoding where available.
std::unique_ptr<LineReader> open_line_reader(const std::string& path,
                                             size_t decoder_threads = 1);

// Implemented in src/line_reader_backend.cpp.
// Returns nullptr when built without rapidgzip; caller falls back to zlib.
std::unique_ptr<LineReader> make_parallel_gz_reader(const std::string& path,
                                                    size_t threads);

}  // namespace arsc
