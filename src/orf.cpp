#include "seqscope/orf.hpp"
#include "seqscope/genetic_code.hpp"
#include "seqscope/stats.hpp"
#include <algorithm>
#include <optional>

namespace seqscope {

namespace {

void scanFrame(std::string_view dna, size_t offset, const OrfOptions& options,
               std::vector<ORF>& orfs) {
    std::optional<size_t> start;
    std::string protein;

    for (size_t i = offset; i + 3 <= dna.length(); i += 3) {
        auto codon = dna.substr(i, 3);
        auto aa = genetic_code::lookupCodon(codon);

        if (!start) {
            if (genetic_code::isStartCodon(codon)) {
                start = i;
                protein = "M";
            }
            continue;
        }

        if (!aa) continue;  // no table entry, keep the frame open

        if (*aa == genetic_code::kStop) {
            if (protein.length() >= options.min_protein_length) {
                orfs.push_back({*start, i + 2, static_cast<int>(offset) + 1, std::move(protein)});
            }
            start.reset();
            protein.clear();
        } else {
            protein.push_back(*aa);
        }
    }
}

} // namespace

std::vector<ORF> findORFs(std::string_view sequence, SequenceKind kind, const OrfOptions& options) {
    const std::string dna = isRnaLike(sequence, kind) ? rnaToDna(sequence)
                                                      : std::string(sequence);

    std::vector<ORF> orfs;
    for (size_t offset = 0; offset < 3; ++offset) {
        scanFrame(dna, offset, options, orfs);
    }

    std::ranges::stable_sort(orfs, [](const ORF& a, const ORF& b) {
        return a.length() > b.length();
    });

    return orfs;
}

std::vector<ORF> findORFs(const NormalizedSequence& seq, const OrfOptions& options) {
    return findORFs(seq.bases(), seq.kind(), options);
}

double orfCoverage(const std::vector<ORF>& orfs, size_t sequence_length) noexcept {
    size_t spanned = 0;
    for (const auto& orf : orfs) {
        spanned += orf.end - orf.start;
    }
    return stats::percentage(static_cast<double>(spanned), static_cast<double>(sequence_length));
}

std::array<size_t, 3> frameDistribution(const std::vector<ORF>& orfs) noexcept {
    std::array<size_t, 3> counts{};
    for (const auto& orf : orfs) {
        if (orf.frame >= 1 && orf.frame <= 3) {
            counts[static_cast<size_t>(orf.frame - 1)]++;
        }
    }
    return counts;
}

} // namespace seqscope
