#pragma once

#include "seqscope/sequence.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seqscope {

enum class MutationType : uint8_t {
    Substitution,
    Insertion,
    Deletion
};

enum class MutationEffect : uint8_t {
    Synonymous,
    Missense,
    Nonsense,
    Frameshift
};

[[nodiscard]] std::string_view toString(MutationType type) noexcept;
[[nodiscard]] std::string_view toString(MutationEffect effect) noexcept;

/**
 * @brief One positional difference between reference and query
 *
 * original is empty for an insertion, mutated is empty for a deletion.
 */
struct Mutation {
    size_t position;
    std::optional<char> original;
    std::optional<char> mutated;
    MutationType type;
    MutationEffect effect;

    [[nodiscard]] bool operator==(const Mutation& other) const = default;
};

struct MutationAnalysis {
    std::vector<Mutation> mutations;
    size_t total_mutations = 0;
    double mutation_rate = 0.0;  // percent of max(len(ref), len(query))

    [[nodiscard]] size_t countOf(MutationType type) const noexcept;
    [[nodiscard]] size_t countOf(MutationEffect effect) const noexcept;
};

/**
 * @brief Position-by-position comparison of two nucleotide sequences
 *
 * This is not an alignment: position i of the reference is only ever
 * compared with position i of the query, so one indel shifts every
 * later position. Positions present in only one sequence are insertions
 * (query longer) or deletions (reference longer), always Frameshift.
 *
 * A substitution's effect comes from translating the codon window
 * [floor(i/3)*3, +3) in both sequences: same residue is Synonymous, a
 * stop in the query is Nonsense, anything else Missense. A window cut
 * short by either sequence end is Missense.
 */
[[nodiscard]] MutationAnalysis compareMutations(std::string_view reference,
                                                std::string_view query);

[[nodiscard]] MutationAnalysis compareMutations(const NormalizedSequence& reference,
                                                const NormalizedSequence& query);

} // namespace seqscope
