#include "args.hpp"
#include "arsc/version.h"
#include <iostream>
#include <string>

namespace arsc {
namespace cli {

void print_version() {
    std::cout << "arsc " << ARSC_VERSION << "\n";
}

void print_usage(const char* program_name) {
    std::cout << "ARSC v" << ARSC_VERSION << "\n";
    std::cout << "Amino-acid residue stoichiometry (N/C/S-ARSC, AvgResMW) per proteome\n";
    std::cout << "Mende et al., Nature Microbiology, 2017\n\n";
    std::cout << "Usage: " << program_name << " [options] <input>\n";
    std::cout << "       " << program_name << " -i <input> [options]\n\n";
    std::cout << "Input: a .faa, .faa.gz or .faa.zst file, or a directory of them\n\n";
    std::cout << "Options:\n";
    std::cout << "  -i, --input <path>       Input file or directory (or give it positionally)\n";
    std::cout << "  -o, --output <file>      Output TSV with header (default: stdout)\n";
    std::cout << "  -t, --threads <int>      Genomes processed in parallel (default: 1)\n";
    std::cout << "  -a, --aa-composition     Add amino acid fractions and TotalAALength columns\n";
    std::cout << "  -d, --decimal-places <int> Digits after the decimal point (default: 6)\n";
    std::cout << "  --min-length <int>       Drop genomes with fewer recognized residues\n";
    std::cout << "  --max-length <int>       Drop genomes with more recognized residues\n";
    std::cout << "  -s, --stats              Print summary statistics to stderr (directory input)\n";
    std::cout << "  --no-header              Suppress the header line on stdout\n";
    std::cout << "  --failures <file>        Write failed genomes as TSV (Genome, Error, Message)\n";
    std::cout << "  -v, --verbose            Show progress\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " Ecoli.faa.gz\n";
    std::cout << "  " << program_name << " -i proteomes/ -o arsc.tsv -a -t 8 --stats\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    std::string flag_input;
    std::string positional_input;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> uint64_t {
            try {
                size_t idx = 0;
                if (!value.empty() && value[0] == '-') {
                    throw ParseArgsExit(1, "Error: " + flag + " must be >= 0");
                }
                uint64_t parsed = std::stoull(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input" || arg == "--input_dir") {
            flag_input = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--failures") {
            opts.failures_file = require_value(arg);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-d" || arg == "--decimal-places") {
            opts.decimal_places = parse_int(arg, require_value(arg));
            if (opts.decimal_places < 0 || opts.decimal_places > 17) {
                throw ParseArgsExit(1, "Error: --decimal-places must be between 0 and 17");
            }
        } else if (arg == "-a" || arg == "--aa-composition") {
            opts.aa_composition = true;
        } else if (arg == "--min-length") {
            opts.min_length = parse_size(arg, require_value(arg));
        } else if (arg == "--max-length") {
            opts.max_length = parse_size(arg, require_value(arg));
        } else if (arg == "-s" || arg == "--stats") {
            opts.stats = true;
        } else if (arg == "--no-header") {
            opts.no_header = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else if (positional_input.empty()) {
            positional_input = arg;
        } else {
            throw ParseArgsExit(1, "Error: Unexpected argument: " + arg);
        }
    }

    if (!flag_input.empty() && !positional_input.empty()) {
        throw ParseArgsExit(1, "Error: Cannot specify both positional input and -i/--input");
    }
    opts.input = flag_input.empty() ? positional_input : flag_input;
    if (opts.input.empty()) {
        throw ParseArgsExit(1, "Error: Missing input: provide a .faa/.faa.gz file or directory");
    }

    if (opts.min_length && opts.max_length && *opts.min_length > *opts.max_length) {
        throw ParseArgsExit(1, "Error: --min-length must not exceed --max-length");
    }

    return opts;
}

}  // namespace cli
}  // namespace arsc
