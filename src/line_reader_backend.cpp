// line_reader_backend.cpp
// Implements make_parallel_gz_reader(), the only translation unit that
// includes rapidgzip headers, isolating its ODR-visible symbols from all
// other TUs.

#ifdef HAVE_RAPIDGZIP
#include <rapidgzip/rapidgzip.hpp>
#include <filereader/Standard.hpp>
#endif

#include "arsc/errors.hpp"
#include "arsc/line_reader.hpp"

#include <exception>
#include <memory>
#include <string>

namespace {

#ifdef HAVE_RAPIDGZIP
class RapidgzipLineReader : public arsc::LineReader {
public:
    RapidgzipLineReader(const std::string& path, size_t threads) : path_(path) {
        try {
            reader_ = std::make_unique<rapidgzip::ParallelGzipReader<>>(
                std::make_unique<rapidgzip::StandardFileReader>(path),
                threads,
                CHUNK_SIZE);
        } catch (const std::exception& e) {
            throw arsc::GenomeError(arsc::ErrorKind::IOError,
                                    "Failed to open file: " + path + ": " + e.what());
        }
    }

protected:
    size_t read_chunk(char* buf, size_t n) override {
        try {
            return reader_->read(buf, n);
        } catch (const std::exception& e) {
            throw arsc::GenomeError(arsc::ErrorKind::IOError,
                                    path_ + ": gzip read failed: " + e.what());
        }
    }

private:
    std::string path_;
    std::unique_ptr<rapidgzip::ParallelGzipReader<>> reader_;
};
#endif  // HAVE_RAPIDGZIP

}  // anonymous namespace

namespace arsc {

std::unique_ptr<LineReader> make_parallel_gz_reader(const std::string& path, size_t threads) {
#ifdef HAVE_RAPIDGZIP
    return std::make_unique<RapidgzipLineReader>(path, threads);
#else
    (void)path;
    (void)threads;
    return nullptr;  // caller falls back to zlib
#endif
}

}  // namespace arsc
