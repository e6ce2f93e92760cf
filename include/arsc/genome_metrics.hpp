#pragma once

#include "arsc/composition.hpp"
#include "arsc/residue_table.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace arsc {

/**
 * Running totals for one genome.
 *
 * Owned by exactly one job. Folding is associative and commutative:
 * every field is an integer sum, and total_weight() is derived from the
 * per-residue counts in table order, so the floating-point result does not
 * depend on the order sequences were folded in.
 */
struct GenomeAccumulator {
    uint64_t total_carbon = 0;
    uint64_t total_nitrogen = 0;
    uint64_t total_sulfur = 0;
    uint64_t total_residues = 0;    // recognized residues only
    uint64_t unknown_residues = 0;
    uint64_t sequence_count = 0;
    std::array<uint64_t, kNumResidues> residue_counts{};

    double total_weight() const;
};

// Add one sequence to the genome totals.
void fold(GenomeAccumulator& acc, const SequenceComposition& comp);

// Combine partial totals of the same genome.
void merge(GenomeAccumulator& acc, const GenomeAccumulator& other);

struct GenomeMetrics {
    std::string genome_id;
    double n_arsc = 0.0;
    double c_arsc = 0.0;
    double s_arsc = 0.0;
    double avg_res_mw = 0.0;

    // Composition detail carried through to the output writer
    uint64_t total_residues = 0;
    uint64_t unknown_residues = 0;
    uint64_t sequence_count = 0;
    std::array<uint64_t, kNumResidues> residue_counts{};

    // Fraction of recognized residues that are kResidueTable[idx]
    double residue_fraction(size_t idx) const;
};

// Derive the per-residue ratios.
// Throws GenomeError(DegenerateGenome) when no residue was recognized.
GenomeMetrics finalize(const GenomeAccumulator& acc, const std::string& genome_id);

}  // namespace arsc
