#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace arsc {

/**
 * Lazy stream of protein sequences belonging to one genome.
 *
 * Implementations report malformed data with GenomeError(ParseError) and
 * read failures with GenomeError(IOError) from next().
 */
class SequenceSource {
public:
    virtual ~SequenceSource() = default;

    // Store the next residue string in `sequence`. Returns false when exhausted.
    virtual bool next(std::string& sequence) = 0;
};

// Sequences already held in memory
class VectorSequenceSource : public SequenceSource {
public:
    explicit VectorSequenceSource(std::vector<std::string> sequences)
        : sequences_(std::move(sequences)) {}

    bool next(std::string& sequence) override {
        if (pos_ >= sequences_.size()) return false;
        sequence = sequences_[pos_++];
        return true;
    }

private:
    std::vector<std::string> sequences_;
    size_t pos_ = 0;
};

}  // namespace arsc
