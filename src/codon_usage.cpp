#include "seqscope/codon_usage.hpp"
#include "seqscope/genetic_code.hpp"
#include "seqscope/stats.hpp"
#include <cmath>

namespace seqscope {

namespace {

constexpr double kUniformCodonFrequency = 1.0 / 64.0;

double codonBias(const OrderedCounter& codons) {
    if (codons.empty()) return 0.0;

    double deviation = 0.0;
    for (const auto& entry : codons) {
        deviation += std::abs(entry.frequency(codons.totalCount()) - kUniformCodonFrequency);
    }

    return deviation / static_cast<double>(codons.uniqueCount());
}

} // namespace

CodonUsageResult codonUsage(std::string_view sequence, SequenceKind kind,
                            const CodonUsageOptions& options) {
    CodonUsageResult result;

    const bool rna = isRnaLike(sequence, kind);
    const std::string dna = rnaToDna(sequence);

    for (size_t i = 0; i + 3 <= dna.length(); i += 3) {
        std::string_view codon(dna.data() + i, 3);

        result.codons.add(rna ? dnaToRna(codon) : std::string(codon));

        if (auto aa = genetic_code::lookupCodon(codon)) {
            result.amino_acids.add(std::string_view(&*aa, 1));
            if (*aa == genetic_code::kStop) {
                result.stop_codons++;
            }
        }
    }

    result.total_codons = result.codons.totalCount();
    result.most_frequent = keysOf(result.codons.mostFrequent(options.rank_size));
    result.least_frequent = keysOf(result.codons.leastFrequent(options.rank_size));
    result.codon_bias = stats::roundTo(codonBias(result.codons), 3);

    return result;
}

CodonUsageResult codonUsage(const NormalizedSequence& seq, const CodonUsageOptions& options) {
    return codonUsage(seq.bases(), seq.kind(), options);
}

} // namespace seqscope
