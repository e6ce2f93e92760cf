#pragma once

#include <stdexcept>
#include <string>

namespace arsc {

// Failure classes for a single genome job. None of them is fatal to a batch.
enum class ErrorKind {
    ParseError,        // malformed sequence data
    DegenerateGenome,  // no recognized residues, metrics undefined
    IOError            // open/read/decompression failure
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::DegenerateGenome: return "DegenerateGenome";
        case ErrorKind::IOError: return "IOError";
    }
    return "Unknown";
}

class GenomeError : public std::runtime_error {
public:
    GenomeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace arsc
