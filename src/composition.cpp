#include "arsc/composition.hpp"

namespace arsc {

SequenceComposition count_composition(std::string_view sequence) {
    SequenceComposition comp;
    comp.length = sequence.size();
    for (char c : sequence) {
        const int idx = residue_index(c);
        if (idx < 0) {
            comp.unknown_count++;
        } else {
            comp.residue_counts[static_cast<size_t>(idx)]++;
        }
    }
    return comp;
}

}  // namespace arsc
