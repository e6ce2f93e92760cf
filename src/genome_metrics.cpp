#include "arsc/genome_metrics.hpp"
#include "arsc/errors.hpp"

namespace arsc {

double GenomeAccumulator::total_weight() const {
    double weight = 0.0;
    for (size_t i = 0; i < kNumResidues; ++i) {
        weight += static_cast<double>(residue_counts[i]) * kResidueTable[i].weight;
    }
    return weight;
}

void fold(GenomeAccumulator& acc, const SequenceComposition& comp) {
    for (size_t i = 0; i < kNumResidues; ++i) {
        const uint64_t n = comp.residue_counts[i];
        if (n == 0) continue;
        const ResidueInfo& res = kResidueTable[i];
        acc.total_carbon += n * static_cast<uint64_t>(res.carbon);
        acc.total_nitrogen += n * static_cast<uint64_t>(res.nitrogen);
        acc.total_sulfur += n * static_cast<uint64_t>(res.sulfur);
        acc.total_residues += n;
        acc.residue_counts[i] += n;
    }
    acc.unknown_residues += comp.unknown_count;
    acc.sequence_count++;
}

void merge(GenomeAccumulator& acc, const GenomeAccumulator& other) {
    acc.total_carbon += other.total_carbon;
    acc.total_nitrogen += other.total_nitrogen;
    acc.total_sulfur += other.total_sulfur;
    acc.total_residues += other.total_residues;
    acc.unknown_residues += other.unknown_residues;
    acc.sequence_count += other.sequence_count;
    for (size_t i = 0; i < kNumResidues; ++i) {
        acc.residue_counts[i] += other.residue_counts[i];
    }
}

double GenomeMetrics::residue_fraction(size_t idx) const {
    if (total_residues == 0 || idx >= kNumResidues) return 0.0;
    return static_cast<double>(residue_counts[idx]) / static_cast<double>(total_residues);
}

GenomeMetrics finalize(const GenomeAccumulator& acc, const std::string& genome_id) {
    if (acc.total_residues == 0) {
        std::string reason = acc.sequence_count == 0
            ? "no sequences"
            : std::to_string(acc.sequence_count) + " sequence(s) with no recognized residues";
        throw GenomeError(ErrorKind::DegenerateGenome,
                          "metrics undefined (" + reason + ")");
    }

    const double residues = static_cast<double>(acc.total_residues);

    GenomeMetrics m;
    m.genome_id = genome_id;
    m.n_arsc = static_cast<double>(acc.total_nitrogen) / residues;
    m.c_arsc = static_cast<double>(acc.total_carbon) / residues;
    m.s_arsc = static_cast<double>(acc.total_sulfur) / residues;
    m.avg_res_mw = acc.total_weight() / residues;
    m.total_residues = acc.total_residues;
    m.unknown_residues = acc.unknown_residues;
    m.sequence_count = acc.sequence_count;
    m.residue_counts = acc.residue_counts;
    return m;
}

}  // namespace arsc
