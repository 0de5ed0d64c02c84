#pragma once

#include "seqscope/sequence.hpp"
#include <array>
#include <string>
#include <vector>

namespace seqscope {

/**
 * @brief ORF search parameters
 */
struct OrfOptions {
    size_t min_protein_length = 5;  // residues, start M included, stop excluded

    [[nodiscard]] static constexpr OrfOptions permissive() noexcept {
        return OrfOptions{1};
    }
};

/**
 * @brief A start-to-stop open reading frame on the forward strand
 */
struct ORF {
    size_t start;         // index of the first base of the start codon
    size_t end;           // index of the last base of the stop codon
    int frame;            // 1, 2 or 3
    std::string protein;  // from the start M up to, not including, the stop

    [[nodiscard]] size_t length() const noexcept { return protein.length(); }
    [[nodiscard]] size_t nucleotideLength() const noexcept { return end - start + 1; }

    [[nodiscard]] bool operator==(const ORF& other) const = default;
};

/**
 * @brief Find ORFs in the three forward reading frames
 *
 * Each frame is scanned codon by codon. An ATG opens an ORF when none is
 * open in that frame; the next in-frame stop closes it, and it is kept if
 * its protein reaches options.min_protein_length. ORFs still open at the
 * end of the sequence are dropped.
 *
 * @return ORFs sorted by descending protein length; equal lengths keep
 *         discovery order (frame, then position)
 */
[[nodiscard]] std::vector<ORF> findORFs(std::string_view sequence,
                                        SequenceKind kind = SequenceKind::DNA,
                                        const OrfOptions& options = OrfOptions{});

[[nodiscard]] std::vector<ORF> findORFs(const NormalizedSequence& seq,
                                        const OrfOptions& options = OrfOptions{});

/**
 * @brief Percentage of the sequence spanned by ORFs, sum(end - start) / length
 */
[[nodiscard]] double orfCoverage(const std::vector<ORF>& orfs, size_t sequence_length) noexcept;

// Number of ORFs in display frames 1, 2 and 3
[[nodiscard]] std::array<size_t, 3> frameDistribution(const std::vector<ORF>& orfs) noexcept;

} // namespace seqscope
