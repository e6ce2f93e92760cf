#pragma once

#include "arsc/line_reader.hpp"
#include "arsc/sequence_source.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace arsc {

/**
 * Protein FASTA reader yielding one residue string per record.
 *
 * - '>' lines start a record; the following lines are concatenated
 * - blank lines are skipped, trailing whitespace and '\r' are trimmed
 * - a header with no sequence lines yields an empty sequence
 * - non-blank data before the first header is a ParseError
 *
 * Plain, gzip and zstd input are handled by the underlying LineReader.
 */
class FastaSequenceSource : public SequenceSource {
public:
    explicit FastaSequenceSource(const std::string& path, size_t decoder_threads = 1);
    FastaSequenceSource(std::unique_ptr<LineReader> reader, std::string label);

    bool next(std::string& sequence) override;

    // Identifier (header text up to the first whitespace) of the last record
    const std::string& record_id() const { return record_id_; }
    uint64_t records_read() const { return records_read_; }

private:
    bool next_line(std::string& line);

    std::unique_ptr<LineReader> reader_;
    std::string label_;
    std::string lookahead_;
    bool has_lookahead_ = false;
    std::string record_id_;
    uint64_t line_no_ = 0;
    uint64_t records_read_ = 0;
};

}  // namespace arsc
