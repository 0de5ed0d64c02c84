#pragma once

#include "seqscope/sequence.hpp"
#include "seqscope/counter.hpp"
#include <string>
#include <vector>

namespace seqscope {

/**
 * @brief Tunables for codon usage ranking
 */
struct CodonUsageOptions {
    size_t rank_size = 5;  // length of the most/least frequent lists
};

/**
 * @brief Codon and amino-acid frequencies over frame 0
 */
struct CodonUsageResult {
    OrderedCounter codons;        // keys in the input alphabet (U kept for RNA)
    OrderedCounter amino_acids;   // one-letter codes, '*' for stop
    size_t total_codons = 0;
    size_t stop_codons = 0;       // occurrences translating to a stop
    std::vector<std::string> most_frequent;
    std::vector<std::string> least_frequent;
    double codon_bias = 0.0;      // mean |observed - 1/64|, 3 decimals
};

/**
 * @brief Tabulate non-overlapping codons from offset 0
 *
 * A trailing partial codon is ignored. Codons are looked up in DNA form;
 * ones without a table entry are counted as codons but contribute no
 * amino acid. Ranking ties keep first-seen order. least_frequent is the
 * tail of the descending ranking.
 */
[[nodiscard]] CodonUsageResult codonUsage(std::string_view sequence,
                                          SequenceKind kind = SequenceKind::DNA,
                                          const CodonUsageOptions& options = CodonUsageOptions{});

[[nodiscard]] CodonUsageResult codonUsage(const NormalizedSequence& seq,
                                          const CodonUsageOptions& options = CodonUsageOptions{});

} // namespace seqscope
