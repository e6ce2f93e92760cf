#ifndef ARSC_CLI_ARGS_HPP
#define ARSC_CLI_ARGS_HPP

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace arsc {
namespace cli {

struct Options {
    std::string input;                 // .faa[.gz|.zst] file or directory
    std::string output_file;           // empty = stdout
    std::string failures_file;         // optional TSV of failed genomes
    int num_threads = 1;
    int decimal_places = 6;
    bool aa_composition = false;       // add residue fractions and TotalAALength
    std::optional<uint64_t> min_length;  // recognized residues; unset = no lower bound
    std::optional<uint64_t> max_length;
    bool stats = false;                // summary table on stderr (directory input only)
    bool no_header = false;            // only affects stdout output
    bool verbose = false;
};

// Thrown instead of calling exit() so callers and tests decide what to do.
// exit_code 0 for --help/--version, 1 for usage errors.
class ParseArgsExit : public std::exception {
public:
    explicit ParseArgsExit(int exit_code, std::string message = {})
        : exit_code_(exit_code), message_(std::move(message)) {}

    int exit_code() const noexcept { return exit_code_; }
    const std::string& message() const noexcept { return message_; }
    const char* what() const noexcept override { return message_.c_str(); }

private:
    int exit_code_;
    std::string message_;
};

// Print version string to stdout
void print_version();

// Print usage/help to stdout
void print_usage(const char* program_name);

// Parse command-line arguments into Options
Options parse_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace arsc

#endif  // ARSC_CLI_ARGS_HPP
