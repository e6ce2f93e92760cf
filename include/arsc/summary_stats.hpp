#pragma once

#include "arsc/genome_scheduler.hpp"

#include <cstddef>
#include <ostream>
#include <vector>

namespace arsc {

struct MetricSummary {
    double mean = 0.0;
    double stdev = 0.0;  // sample standard deviation, 0 for a single value
    double min = 0.0;
    double max = 0.0;
};

struct SummaryStats {
    MetricSummary n_arsc;
    MetricSummary c_arsc;
    MetricSummary s_arsc;
    MetricSummary avg_res_mw;
    size_t count = 0;  // successful genomes summarized
};

// Summarize the successful results; failures are ignored.
SummaryStats summarize(const std::vector<JobResult>& results);

// Fixed-width table, one row per metric
void print_summary(std::ostream& os, const SummaryStats& stats, int decimal_places);

}  // namespace arsc
