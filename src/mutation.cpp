#include "seqscope/mutation.hpp"
#include "seqscope/genetic_code.hpp"
#include "seqscope/stats.hpp"
#include <algorithm>

namespace seqscope {

namespace {

MutationEffect substitutionEffect(std::string_view reference, std::string_view query,
                                  size_t position) {
    const size_t codon_start = position / 3 * 3;

    auto ref_codon = rnaToDna(reference.substr(codon_start, 3));
    auto query_codon = rnaToDna(query.substr(codon_start, 3));

    if (ref_codon.length() < 3 || query_codon.length() < 3) {
        return MutationEffect::Missense;
    }

    char ref_aa = genetic_code::translateCodon(ref_codon);
    char query_aa = genetic_code::translateCodon(query_codon);

    if (ref_aa == query_aa) return MutationEffect::Synonymous;
    if (query_aa == genetic_code::kStop) return MutationEffect::Nonsense;
    return MutationEffect::Missense;
}

} // namespace

std::string_view toString(MutationType type) noexcept {
    switch (type) {
        case MutationType::Substitution: return "substitution";
        case MutationType::Insertion: return "insertion";
        case MutationType::Deletion: return "deletion";
    }
    return "unknown";
}

std::string_view toString(MutationEffect effect) noexcept {
    switch (effect) {
        case MutationEffect::Synonymous: return "synonymous";
        case MutationEffect::Missense: return "missense";
        case MutationEffect::Nonsense: return "nonsense";
        case MutationEffect::Frameshift: return "frameshift";
    }
    return "unknown";
}

size_t MutationAnalysis::countOf(MutationType type) const noexcept {
    return static_cast<size_t>(std::ranges::count(mutations, type, &Mutation::type));
}

size_t MutationAnalysis::countOf(MutationEffect effect) const noexcept {
    return static_cast<size_t>(std::ranges::count(mutations, effect, &Mutation::effect));
}

MutationAnalysis compareMutations(std::string_view reference, std::string_view query) {
    MutationAnalysis analysis;
    const size_t max_length = std::max(reference.length(), query.length());

    for (size_t i = 0; i < max_length; ++i) {
        const bool in_ref = i < reference.length();
        const bool in_query = i < query.length();

        if (in_ref && in_query) {
            if (reference[i] == query[i]) continue;

            analysis.mutations.push_back({i, reference[i], query[i],
                                          MutationType::Substitution,
                                          substitutionEffect(reference, query, i)});
        } else if (in_ref) {
            analysis.mutations.push_back({i, reference[i], std::nullopt,
                                          MutationType::Deletion, MutationEffect::Frameshift});
        } else {
            analysis.mutations.push_back({i, std::nullopt, query[i],
                                          MutationType::Insertion, MutationEffect::Frameshift});
        }
    }

    analysis.total_mutations = analysis.mutations.size();
    analysis.mutation_rate = stats::percentage(static_cast<double>(analysis.total_mutations),
                                               static_cast<double>(max_length));
    return analysis;
}

MutationAnalysis compareMutations(const NormalizedSequence& reference,
                                  const NormalizedSequence& query) {
    return compareMutations(reference.bases(), query.bases());
}

} // namespace seqscope
