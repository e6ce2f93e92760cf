#pragma once

#include "arsc/genome_scheduler.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace arsc {

struct OutputFormat {
    int decimal_places = 6;
    bool aa_composition = false;  // 20 residue fractions + TotalAALength
    bool header = true;
};

// Drop successful genomes whose recognized residue count lies outside
// [min_length, max_length]. An absent bound is open. Failures are kept.
std::vector<JobResult> filter_by_length(std::vector<JobResult> results,
                                        std::optional<uint64_t> min_length,
                                        std::optional<uint64_t> max_length);

// Genome, N_ARSC, C_ARSC, S_ARSC, AvgResMW [, A..Y, TotalAALength]
// Failed genomes are skipped.
void write_metrics_tsv(std::ostream& os,
                       const std::vector<JobResult>& results,
                       const OutputFormat& format);

// Genome, Error, Message for every failed genome
void write_failures_tsv(std::ostream& os, const std::vector<JobResult>& results);

}  // namespace arsc
