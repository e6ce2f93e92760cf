#include "arsc/line_reader.hpp"
#include "arsc/errors.hpp"

#include <cstdio>
#include <zlib.h>

#ifdef HAVE_ZSTD
#include <zstd.h>
#endif

namespace arsc {

bool LineReader::readline(std::string& line) {
    line.clear();
    bool got_data = false;
    while (true) {
        for (size_t i = buf_pos_; i < buf_used_; ++i) {
            if (buf_[i] == '\n') {
                line.append(buf_.data() + buf_pos_, i - buf_pos_);
                buf_pos_ = i + 1;
                return true;
            }
        }
        if (buf_pos_ < buf_used_) {
            line.append(buf_.data() + buf_pos_, buf_used_ - buf_pos_);
            got_data = true;
        }
        buf_pos_ = buf_used_ = 0;
        if (eof_ || !refill()) return got_data;
    }
}

bool LineReader::refill() {
    const size_t n = read_chunk(buf_.data(), buf_.size());
    if (n == 0) {
        eof_ = true;
        return false;
    }
    buf_used_ = n;
    buf_pos_ = 0;
    return true;
}

namespace {

// zlib reads gzip and, transparently, uncompressed files.
class ZlibLineReader : public LineReader {
public:
    explicit ZlibLineReader(const std::string& path) : path_(path) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) {
            throw GenomeError(ErrorKind::IOError, "Failed to open file: " + path);
        }
        gzbuffer(gz_, static_cast<unsigned>(CHUNK_SIZE));
    }

    ~ZlibLineReader() override {
        if (gz_) gzclose(gz_);
    }

    ZlibLineReader(const ZlibLineReader&) = delete;
    ZlibLineReader& operator=(const ZlibLineReader&) = delete;

protected:
    size_t read_chunk(char* buf, size_t n) override {
        const int got = gzread(gz_, buf, static_cast<unsigned>(n));
        if (got < 0) {
            int errnum = 0;
            const char* msg = gzerror(gz_, &errnum);
            throw GenomeError(ErrorKind::IOError,
                              path_ + ": gzip read failed: " + (msg ? msg : "unknown error"));
        }
        return static_cast<size_t>(got);
    }

private:
    std::string path_;
    gzFile gz_ = nullptr;
};

#ifdef HAVE_ZSTD
class ZstdLineReader : public LineReader {
public:
    explicit ZstdLineReader(const std::string& path)
        : path_(path), in_buf_(ZSTD_DStreamInSize()) {
        file_ = std::fopen(path.c_str(), "rb");
        if (!file_) {
            throw GenomeError(ErrorKind::IOError, "Failed to open file: " + path);
        }
        dctx_ = ZSTD_createDCtx();
        if (!dctx_) {
            std::fclose(file_);
            throw GenomeError(ErrorKind::IOError, path + ": cannot create zstd context");
        }
    }

    ~ZstdLineReader() override {
        ZSTD_freeDCtx(dctx_);
        std::fclose(file_);
    }

    ZstdLineReader(const ZstdLineReader&) = delete;
    ZstdLineReader& operator=(const ZstdLineReader&) = delete;

protected:
    size_t read_chunk(char* buf, size_t n) override {
        ZSTD_outBuffer output = {buf, n, 0};
        while (output.pos == 0) {
            // The decoder may still hold output from the last input block
            if (input_.pos == input_.size && !flush_pending_) {
                const size_t got = std::fread(in_buf_.data(), 1, in_buf_.size(), file_);
                if (got == 0) {
                    if (std::ferror(file_)) {
                        throw GenomeError(ErrorKind::IOError, path_ + ": read failed");
                    }
                    if (frame_open_) {
                        throw GenomeError(ErrorKind::IOError, path_ + ": truncated zstd frame");
                    }
                    return 0;
                }
                input_ = {in_buf_.data(), got, 0};
            }
            const size_t ret = ZSTD_decompressStream(dctx_, &output, &input_);
            if (ZSTD_isError(ret)) {
                throw GenomeError(ErrorKind::IOError,
                                  path_ + ": zstd decode failed: " + ZSTD_getErrorName(ret));
            }
            frame_open_ = ret != 0;
            flush_pending_ = output.pos == output.size;
        }
        return output.pos;
    }

private:
    std::string path_;
    std::FILE* file_ = nullptr;
    ZSTD_DCtx* dctx_ = nullptr;
    std::vector<char> in_buf_;
    ZSTD_inBuffer input_ = {nullptr, 0, 0};
    bool frame_open_ = false;
    bool flush_pending_ = false;
};
#endif  // HAVE_ZSTD

}  // anonymous namespace

Compression detect_compression(const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) {
        throw GenomeError(ErrorKind::IOError, "Failed to open file: " + path);
    }
    unsigned char magic[4] = {0, 0, 0, 0};
    const size_t got = std::fread(magic, 1, sizeof(magic), f);
    std::fclose(f);

    if (got >= 2 && magic[0] == 0x1f && magic[1] == 0x8b) return Compression::GZIP;
    if (got == 4 && magic[0] == 0x28 && magic[1] == 0xb5 &&
        magic[2] == 0x2f && magic[3] == 0xfd) {
        return Compression::ZSTD;
    }
    return Compression::NONE;
}

std::unique_ptr<LineReader> open_line_reader(const std::string& path, size_t decoder_threads) {
    switch (detect_compression(path)) {
        case Compression::ZSTD:
#ifdef HAVE_ZSTD
            return std::make_unique<ZstdLineReader>(path);
#else
            throw GenomeError(ErrorKind::IOError,
                              path + ": zstd input not supported (built without libzstd)");
#endif
        case Compression::GZIP:
            if (decoder_threads > 1) {
                if (auto reader = make_parallel_gz_reader(path, decoder_threads)) {
                    return reader;
                }
            }
            return std::make_unique<ZlibLineReader>(path);
        case Compression::NONE:
            break;
    }
    return std::make_unique<ZlibLineReader>(path);
}

}  // namespace arsc
