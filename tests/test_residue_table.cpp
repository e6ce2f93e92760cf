// Unit tests for the residue reference table

#include "arsc/residue_table.hpp"
#include <cassert>
#include <iostream>
#include <set>
#include <string>

void test_one_entry_per_code() {
    std::cout << "Testing one entry per canonical code... ";
    const std::string canonical = "ACDEFGHIKLMNPQRSTVWY";
    std::set<char> seen;
    for (const auto& res : arsc::kResidueTable) {
        assert(seen.insert(res.code).second);
        assert(canonical.find(res.code) != std::string::npos);
    }
    assert(seen.size() == 20);
    std::cout << "PASSED\n";
}

void test_values_in_range() {
    std::cout << "Testing atom counts and weights... ";
    for (const auto& res : arsc::kResidueTable) {
        assert(res.carbon >= 0);
        assert(res.nitrogen >= 0);
        assert(res.sulfur >= 0);
        assert(res.weight > 0.0);
    }
    // Only the two sulfur amino acids carry sulfur
    int sulfur_residues = 0;
    for (const auto& res : arsc::kResidueTable) {
        if (res.sulfur > 0) ++sulfur_residues;
    }
    assert(sulfur_residues == 2);
    assert(arsc::lookup_residue('C')->sulfur == 1);
    assert(arsc::lookup_residue('M')->sulfur == 1);
    std::cout << "PASSED\n";
}

void test_known_side_chains() {
    std::cout << "Testing known side-chain compositions... ";
    const arsc::ResidueInfo* g = arsc::lookup_residue('G');
    assert(g && g->carbon == 0 && g->nitrogen == 0 && g->sulfur == 0);
    const arsc::ResidueInfo* r = arsc::lookup_residue('R');
    assert(r && r->carbon == 4 && r->nitrogen == 3);
    const arsc::ResidueInfo* w = arsc::lookup_residue('W');
    assert(w && w->carbon == 9 && w->nitrogen == 1);
    const arsc::ResidueInfo* h = arsc::lookup_residue('H');
    assert(h && h->nitrogen == 2);
    std::cout << "PASSED\n";
}

void test_table_index_round_trip() {
    std::cout << "Testing residue_index agrees with table order... ";
    for (size_t i = 0; i < arsc::kNumResidues; ++i) {
        assert(arsc::residue_index(arsc::kResidueTable[i].code) == static_cast<int>(i));
    }
    static_assert(arsc::residue_index('A') == 0);
    static_assert(arsc::residue_index('Y') == 19);
    std::cout << "PASSED\n";
}

void test_case_folding() {
    std::cout << "Testing lowercase lookup... ";
    assert(arsc::lookup_residue('m') == arsc::lookup_residue('M'));
    assert(arsc::residue_index('k') == arsc::residue_index('K'));
    std::cout << "PASSED\n";
}

void test_not_found() {
    std::cout << "Testing non-canonical symbols... ";
    for (char c : std::string("BZJXUOxbz*-. 0\n")) {
        assert(arsc::lookup_residue(c) == nullptr);
        assert(arsc::residue_index(c) == -1);
    }
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Residue Table Tests ===\n\n";
    test_one_entry_per_code();
    test_values_in_range();
    test_known_side_chains();
    test_table_index_round_trip();
    test_case_folding();
    test_not_found();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
