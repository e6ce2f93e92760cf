#pragma once

/**
 * @file residue_table.hpp
 * @brief Elemental composition of the 20 canonical amino acids
 *
 * Atom counts are side-chain atoms (Baudouin-Cornu et al. 2001, as used for
 * N/C/S-ARSC in Mende et al. 2017). Backbone atoms are identical for every
 * residue and carry no signal, so they are excluded.
 *
 * Weights are average molecular weights of the free amino acids in Da.
 */

#include <array>
#include <cstddef>

namespace arsc {

struct ResidueInfo {
    char code;
    int carbon;
    int nitrogen;
    int sulfur;
    double weight;
};

constexpr size_t kNumResidues = 20;

// Ordered by one-letter code; composition columns follow this order.
constexpr std::array<ResidueInfo, kNumResidues> kResidueTable = {{
    {'A', 1, 0, 0,  89.09},
    {'C', 1, 0, 1, 121.16},
    {'D', 2, 0, 0, 133.10},
    {'E', 3, 0, 0, 147.13},
    {'F', 7, 0, 0, 165.19},
    {'G', 0, 0, 0,  75.07},
    {'H', 4, 2, 0, 155.16},
    {'I', 4, 0, 0, 131.17},
    {'K', 4, 1, 0, 146.19},
    {'L', 4, 0, 0, 131.17},
    {'M', 3, 0, 1, 149.21},
    {'N', 2, 1, 0, 132.12},
    {'P', 3, 0, 0, 115.13},
    {'Q', 3, 1, 0, 146.15},
    {'R', 4, 3, 0, 174.20},
    {'S', 1, 0, 0, 105.09},
    {'T', 2, 0, 0, 119.12},
    {'V', 3, 0, 0, 117.15},
    {'W', 9, 1, 0, 204.23},
    {'Y', 7, 0, 0, 181.19},
}};

// Index into kResidueTable, or -1 for anything that is not a canonical
// residue (ambiguity codes, stop, gap, digits, whitespace).
// Lowercase input is folded to uppercase first.
constexpr int residue_index(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 32);
    switch (c) {
        case 'A': return 0;  case 'C': return 1;  case 'D': return 2;
        case 'E': return 3;  case 'F': return 4;  case 'G': return 5;
        case 'H': return 6;  case 'I': return 7;  case 'K': return 8;
        case 'L': return 9;  case 'M': return 10; case 'N': return 11;
        case 'P': return 12; case 'Q': return 13; case 'R': return 14;
        case 'S': return 15; case 'T': return 16; case 'V': return 17;
        case 'W': return 18; case 'Y': return 19;
        default: return -1;
    }
}

// nullptr means "not a canonical residue"; callers count it as unknown.
inline const ResidueInfo* lookup_residue(char c) {
    const int idx = residue_index(c);
    return idx < 0 ? nullptr : &kResidueTable[static_cast<size_t>(idx)];
}

}  // namespace arsc
