// Unit tests for per-sequence composition counting

#include "arsc/composition.hpp"
#include <cassert>
#include <iostream>
#include <numeric>
#include <string>

static uint64_t sum_counts(const arsc::SequenceComposition& c) {
    return std::accumulate(c.residue_counts.begin(), c.residue_counts.end(), uint64_t{0});
}

void test_empty_sequence() {
    std::cout << "Testing empty sequence... ";
    auto c = arsc::count_composition("");
    assert(c.length == 0);
    assert(c.unknown_count == 0);
    assert(sum_counts(c) == 0);
    std::cout << "PASSED\n";
}

void test_basic_counts() {
    std::cout << "Testing basic counts... ";
    auto c = arsc::count_composition("MKTAYIAKQR");
    assert(c.length == 10);
    assert(c.unknown_count == 0);
    assert(c.residue_counts[arsc::residue_index('A')] == 2);
    assert(c.residue_counts[arsc::residue_index('K')] == 2);
    assert(c.residue_counts[arsc::residue_index('M')] == 1);
    assert(c.residue_counts[arsc::residue_index('W')] == 0);
    std::cout << "PASSED\n";
}

void test_unknown_symbols() {
    std::cout << "Testing unknown symbols are tallied... ";
    auto c = arsc::count_composition("MXK*B-");
    assert(c.length == 6);
    assert(c.unknown_count == 4);
    assert(c.known_count() == 2);
    std::cout << "PASSED\n";
}

void test_lowercase_counts_as_residue() {
    std::cout << "Testing lowercase residues... ";
    auto c = arsc::count_composition("mkMK");
    assert(c.unknown_count == 0);
    assert(c.residue_counts[arsc::residue_index('M')] == 2);
    assert(c.residue_counts[arsc::residue_index('K')] == 2);
    std::cout << "PASSED\n";
}

void test_length_invariant() {
    std::cout << "Testing length == known + unknown... ";
    const std::string samples[] = {"", "XXX", "ACDEFGHIKLMNPQRSTVWY", "acgtnXX*", "MK T\r"};
    for (const auto& s : samples) {
        auto c = arsc::count_composition(s);
        assert(c.length == s.size());
        assert(c.length == sum_counts(c) + c.unknown_count);
    }
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Composition Counter Tests ===\n\n";
    test_empty_sequence();
    test_basic_counts();
    test_unknown_symbols();
    test_lowercase_counts_as_residue();
    test_length_invariant();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
