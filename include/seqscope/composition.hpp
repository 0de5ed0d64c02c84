#pragma once

#include "seqscope/sequence.hpp"
#include "seqscope/counter.hpp"

namespace seqscope {

/**
 * @brief Nucleotide composition with GC/AT content and skew
 *
 * counts holds exactly four keys in the order A, T (or U), G, C. For RNA
 * the "at" figures are computed over A and U.
 */
struct CompositionResult {
    OrderedCounter counts;
    size_t length = 0;
    bool rna = false;
    double gc_content = 0.0;  // percent, 2 decimals
    double at_content = 0.0;  // percent, 2 decimals
    double gc_skew = 0.0;     // (G-C)/(G+C), 3 decimals
    double at_skew = 0.0;     // (A-T)/(A+T), 3 decimals

    // 'T' for DNA, 'U' for RNA
    [[nodiscard]] char thymineSymbol() const noexcept { return rna ? 'U' : 'T'; }

    [[nodiscard]] size_t count(char base) const {
        return counts.getCount(std::string_view(&base, 1));
    }
};

/**
 * @brief Count A, G, C and T/U and derive content and skew
 *
 * The sequence is treated as RNA when @p kind is RNA or it contains a U.
 * Empty input yields zero counts and zero percentages.
 */
[[nodiscard]] CompositionResult composition(std::string_view sequence,
                                            SequenceKind kind = SequenceKind::DNA);

[[nodiscard]] CompositionResult composition(const NormalizedSequence& seq);

} // namespace seqscope
