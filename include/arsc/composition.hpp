#pragma once

#include "arsc/residue_table.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace arsc {

/**
 * Residue tally for a single protein sequence.
 *
 * Invariant: length == sum(residue_counts) + unknown_count
 */
struct SequenceComposition {
    std::array<uint64_t, kNumResidues> residue_counts{};  // indexed like kResidueTable
    uint64_t unknown_count = 0;
    uint64_t length = 0;

    uint64_t known_count() const { return length - unknown_count; }
};

// Count residues of one sequence. Symbols outside the canonical 20 go to
// unknown_count. An empty sequence gives an all-zero composition.
SequenceComposition count_composition(std::string_view sequence);

}  // namespace arsc
