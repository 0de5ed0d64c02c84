#include "seqscope/protein.hpp"
#include "seqscope/genetic_code.hpp"
#include "seqscope/stats.hpp"
#include <vector>

namespace seqscope {

// ============================================================================
// Protein Properties
// ============================================================================

ProteinProperties proteinProperties(std::string_view protein) {
    ProteinProperties props;
    props.length = protein.length();

    double weight = 0.0;
    std::vector<double> hydropathy;
    hydropathy.reserve(protein.length());

    size_t basic = 0;
    size_t acidic = 0;

    for (char residue : protein) {
        props.composition.add(std::string_view(&residue, 1));

        if (isBasic(residue)) basic++;
        if (isAcidic(residue)) acidic++;

        if (auto aa = aminoAcidProperties(residue)) {
            weight += aa->molecular_weight;
            hydropathy.push_back(aa->hydropathy);
        }
    }

    const double charge = static_cast<double>(basic) - static_cast<double>(acidic);

    props.molecular_weight = stats::roundTo(weight, 2);
    props.isoelectric_point = stats::roundTo(7.0 + 0.5 * charge, 2);
    props.hydropathy = stats::roundTo(stats::mean(hydropathy), 2);

    return props;
}

ProteinProperties proteinProperties(const NormalizedSequence& seq) {
    return proteinProperties(seq.bases());
}

// ============================================================================
// Translation
// ============================================================================

TranslationResult translate(std::string_view sequence, size_t frame, SequenceKind kind) {
    if (frame > 2) {
        throw SequenceError("Reading frame offset must be 0, 1 or 2, got " +
                            std::to_string(frame));
    }

    const std::string dna = isRnaLike(sequence, kind) ? rnaToDna(sequence)
                                                      : std::string(sequence);

    TranslationResult result;
    result.frame = frame;
    result.protein.reserve(dna.length() / 3);

    for (size_t i = frame; i + 3 <= dna.length(); i += 3) {
        result.protein.push_back(genetic_code::translateCodon(std::string_view(dna.data() + i, 3)));
    }

    result.properties = proteinProperties(result.protein);
    return result;
}

TranslationResult translate(const NormalizedSequence& seq, size_t frame) {
    return translate(seq.bases(), frame, seq.kind());
}

std::array<TranslationResult, 3> translateAllFrames(std::string_view sequence, SequenceKind kind) {
    return {
        translate(sequence, 0, kind),
        translate(sequence, 1, kind),
        translate(sequence, 2, kind)
    };
}

} // namespace seqscope
