// Entry point for the arsc CLI
//
// Usage:
//   arsc Ecoli.faa.gz
//   arsc -i proteomes/ -o arsc.tsv -a -t 8 --stats

#include "args.hpp"
#include "arsc/genome_discovery.hpp"
#include "arsc/genome_scheduler.hpp"
#include "arsc/log_utils.hpp"
#include "arsc/result_writer.hpp"
#include "arsc/summary_stats.hpp"
#include "arsc/version.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

void write_output(const arsc::cli::Options& opts, const std::vector<arsc::JobResult>& results) {
    arsc::OutputFormat format;
    format.decimal_places = opts.decimal_places;
    format.aa_composition = opts.aa_composition;

    if (opts.output_file.empty()) {
        format.header = !opts.no_header;
        arsc::write_metrics_tsv(std::cout, results, format);
        std::cout.flush();
        return;
    }

    std::ofstream out(opts.output_file);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + opts.output_file);
    }
    format.header = true;
    arsc::write_metrics_tsv(out, results, format);
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + opts.output_file);
    }
    std::cerr << "Output written to " << opts.output_file << "\n";
}

void write_failures(const std::string& path, const std::vector<arsc::JobResult>& results) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open failures file: " + path);
    }
    arsc::write_failures_tsv(out, results);
    if (!out) {
        throw std::runtime_error("Failed writing failures file: " + path);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    arsc::cli::Options opts;
    try {
        opts = arsc::cli::parse_args(argc, argv);
    } catch (const arsc::cli::ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            std::cerr << "Run '" << argv[0] << " --help' for usage information.\n";
        }
        return e.exit_code();
    }

    try {
        std::error_code ec;
        const bool is_dir = std::filesystem::is_directory(opts.input, ec);
        if (opts.stats && !is_dir) {
            std::cerr << "Error: --stats can only be used with directory input (not a single file)\n";
            return 1;
        }

        std::vector<std::filesystem::path> files;
        try {
            files = arsc::collect_protein_files(opts.input);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        std::cerr << "ARSC v" << ARSC_VERSION << "\n";
        std::cerr << "Found " << files.size() << " files to process.\n";
        std::cerr << "Using " << opts.num_threads << " threads.\n";

        // Spare threads go to gzip decoding when there are fewer files than threads
        const size_t threads = static_cast<size_t>(opts.num_threads);
        const size_t decoder_threads = std::max<size_t>(1, threads / files.size());

        const auto inputs = arsc::make_genome_inputs(files, decoder_threads);

        arsc::log_utils::ProgressLine progress(opts.verbose);
        const auto start = std::chrono::steady_clock::now();
        auto results = arsc::run_genomes(
            inputs, opts.num_threads,
            [&progress](size_t done, size_t total, const arsc::JobResult&) {
                progress.update(done, total);
            });
        progress.finish();
        const auto end = std::chrono::steady_clock::now();

        size_t failed = 0;
        for (const auto& r : results) {
            if (r.ok()) continue;
            ++failed;
            std::cerr << "Warning: " << r.genome_id << ": "
                      << arsc::error_kind_name(r.failure->kind) << ": "
                      << r.failure->message << "\n";
        }
        const size_t succeeded = results.size() - failed;

        std::cerr << "Processed " << results.size() << " genomes ("
                  << succeeded << " ok, " << failed << " failed) in "
                  << arsc::log_utils::format_elapsed(start, end) << "\n";

        if (!opts.failures_file.empty()) {
            write_failures(opts.failures_file, results);
        }

        if (opts.min_length || opts.max_length) {
            results = arsc::filter_by_length(std::move(results), opts.min_length, opts.max_length);
            std::cerr << "After filtering: " << results.size() << " results.\n";
        }

        if (opts.stats) {
            const auto stats = arsc::summarize(results);
            if (stats.count > 0) {
                arsc::print_summary(std::cerr, stats, opts.decimal_places);
            } else {
                std::cerr << "No successful genomes to summarize.\n";
            }
        }

        write_output(opts, results);

        return (succeeded == 0 && failed > 0) ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
