#pragma once

#include "seqscope/sequence.hpp"
#include "seqscope/counter.hpp"
#include <array>
#include <string>

namespace seqscope {

/**
 * @brief Aggregate physicochemical properties of a protein string
 *
 * Residues without a property entry ('*', 'X') add nothing to the weight
 * and are left out of the hydropathy average. The isoelectric point is
 * the count-based estimate 7 + 0.5 * (basic - acidic) with basic = R,K,H
 * and acidic = D,E, not a titration curve.
 */
struct ProteinProperties {
    size_t length = 0;
    double molecular_weight = 0.0;   // Da, 2 decimals
    double isoelectric_point = 7.0;  // 2 decimals
    double hydropathy = 0.0;         // mean Kyte-Doolittle, 2 decimals
    OrderedCounter composition;      // residue -> count, first-seen order
};

/**
 * @brief Result of translating one reading frame
 */
struct TranslationResult {
    std::string protein;  // stops kept as '*', unknown codons as 'X'
    size_t frame = 0;     // 0-based nucleotide offset
    ProteinProperties properties;

    [[nodiscard]] size_t length() const noexcept { return protein.length(); }
};

/**
 * @brief Compute composition, weight, pI and hydropathy of a protein
 * @param protein One-letter residues, uppercase
 */
[[nodiscard]] ProteinProperties proteinProperties(std::string_view protein);

[[nodiscard]] ProteinProperties proteinProperties(const NormalizedSequence& seq);

/**
 * @brief Translate a nucleotide sequence starting at @p frame
 *
 * Every complete codon from the offset onward is translated, stops
 * included; translation does not halt at a stop. Input is treated as RNA
 * when @p kind is RNA or it contains a U.
 *
 * @param frame Nucleotide offset 0, 1 or 2
 * @throws SequenceError if frame > 2
 */
[[nodiscard]] TranslationResult translate(std::string_view sequence, size_t frame = 0,
                                          SequenceKind kind = SequenceKind::DNA);

[[nodiscard]] TranslationResult translate(const NormalizedSequence& seq, size_t frame = 0);

/**
 * @brief Translations of frames 0, 1 and 2, in that order
 */
[[nodiscard]] std::array<TranslationResult, 3> translateAllFrames(
    std::string_view sequence,
    SequenceKind kind = SequenceKind::DNA
);

} // namespace seqscope
