#include "arsc/result_writer.hpp"
#include "arsc/residue_table.hpp"

#include <iomanip>
#include <utility>

namespace arsc {

std::vector<JobResult> filter_by_length(std::vector<JobResult> results,
                                        std::optional<uint64_t> min_length,
                                        std::optional<uint64_t> max_length) {
    std::vector<JobResult> kept;
    kept.reserve(results.size());
    for (auto& r : results) {
        if (r.ok()) {
            const uint64_t len = r.metrics->total_residues;
            if (min_length && len < *min_length) continue;
            if (max_length && len > *max_length) continue;
        }
        kept.push_back(std::move(r));
    }
    return kept;
}

void write_metrics_tsv(std::ostream& os,
                       const std::vector<JobResult>& results,
                       const OutputFormat& format) {
    if (format.header) {
        os << "Genome\tN_ARSC\tC_ARSC\tS_ARSC\tAvgResMW";
        if (format.aa_composition) {
            for (const auto& res : kResidueTable) os << '\t' << res.code;
            os << "\tTotalAALength";
        }
        os << '\n';
    }

    const auto old_flags = os.flags();
    const auto old_precision = os.precision();
    os << std::fixed << std::setprecision(format.decimal_places);

    for (const auto& r : results) {
        if (!r.ok()) continue;
        const GenomeMetrics& m = *r.metrics;
        os << m.genome_id
           << '\t' << m.n_arsc
           << '\t' << m.c_arsc
           << '\t' << m.s_arsc
           << '\t' << m.avg_res_mw;
        if (format.aa_composition) {
            for (size_t i = 0; i < kNumResidues; ++i) {
                os << '\t' << m.residue_fraction(i);
            }
            os << '\t' << m.total_residues;
        }
        os << '\n';
    }

    os.flags(old_flags);
    os.precision(old_precision);
}

void write_failures_tsv(std::ostream& os, const std::vector<JobResult>& results) {
    os << "Genome\tError\tMessage\n";
    for (const auto& r : results) {
        if (r.ok()) continue;
        os << r.failure->genome_id << '\t'
           << error_kind_name(r.failure->kind) << '\t'
           << r.failure->message << '\n';
    }
}

}  // namespace arsc
