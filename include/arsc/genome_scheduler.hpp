#pragma once

#include "arsc/errors.hpp"
#include "arsc/genome_metrics.hpp"
#include "arsc/sequence_source.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arsc {

// One genome to analyse. `open` is called on the worker that runs the job,
// so file opening and decompression happen inside the worker.
struct GenomeInput {
    std::string genome_id;
    std::function<std::unique_ptr<SequenceSource>()> open;
};

struct GenomeFailure {
    std::string genome_id;
    ErrorKind kind = ErrorKind::IOError;
    std::string message;
};

// Exactly one of metrics / failure is set.
struct JobResult {
    std::string genome_id;
    std::optional<GenomeMetrics> metrics;
    std::optional<GenomeFailure> failure;

    bool ok() const { return metrics.has_value(); }
};

// Called once per finished genome. Calls are serialized and must not throw.
using ProgressCallback = std::function<void(size_t done, size_t total, const JobResult& result)>;

/**
 * Run one genome job: open the source, fold every sequence into a fresh
 * accumulator, finalize.
 *
 * Never throws for per-genome problems; GenomeError keeps its kind, any
 * other std::exception raised by the source is reported as IOError.
 */
JobResult process_genome(const GenomeInput& input);

/**
 * Process all genomes with at most `worker_count` running at once.
 *
 * The returned vector has one entry per input, at the input's index, so the
 * result is identical for every worker_count. Throws std::invalid_argument if
 * worker_count < 1.
 */
std::vector<JobResult> run_genomes(const std::vector<GenomeInput>& genomes,
                                   int worker_count,
                                   const ProgressCallback& progress = nullptr);

}  // namespace arsc
