#include "arsc/fasta_reader.hpp"
#include "arsc/errors.hpp"

#include <cctype>
#include <utility>

namespace arsc {

namespace {

inline void trim_right(std::string& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
}

}  // anonymous namespace

FastaSequenceSource::FastaSequenceSource(const std::string& path, size_t decoder_threads)
    : reader_(open_line_reader(path, decoder_threads)), label_(path) {}

FastaSequenceSource::FastaSequenceSource(std::unique_ptr<LineReader> reader, std::string label)
    : reader_(std::move(reader)), label_(std::move(label)) {}

bool FastaSequenceSource::next_line(std::string& line) {
    if (has_lookahead_) {
        line = std::move(lookahead_);
        has_lookahead_ = false;
        return true;
    }
    if (!reader_->readline(line)) return false;
    ++line_no_;
    trim_right(line);
    return true;
}

bool FastaSequenceSource::next(std::string& sequence) {
    std::string line;

    // Skip blank lines up to the next header
    do {
        if (!next_line(line)) return false;
    } while (line.empty());

    if (line[0] != '>') {
        throw GenomeError(ErrorKind::ParseError,
                          label_ + ":" + std::to_string(line_no_) +
                          ": sequence data outside a FASTA record (expected '>')");
    }

    size_t id_end = 1;
    while (id_end < line.size() && !std::isspace(static_cast<unsigned char>(line[id_end]))) {
        ++id_end;
    }
    record_id_.assign(line, 1, id_end - 1);

    sequence.clear();
    while (next_line(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            lookahead_ = std::move(line);
            has_lookahead_ = true;
            break;
        }
        sequence += line;
    }

    ++records_read_;
    return true;
}

}  // namespace arsc
