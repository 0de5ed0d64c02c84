#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <ranges>
#include <concepts>
#include <cstdint>
#include <iosfwd>

namespace seqscope {

/**
 * @brief Exception class for sequence-related errors
 */
class SequenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Declared kind of a symbol sequence, selects the valid alphabet
 */
enum class SequenceKind : uint8_t {
    DNA,
    RNA,
    Protein
};

/**
 * @brief C++20 concept for sequence-like types
 */
template<typename T>
concept SequenceLike = requires(T t) {
    { t.bases() } -> std::convertible_to<std::string_view>;
    { t.kind() } -> std::convertible_to<SequenceKind>;
};

// Alphabet helpers
[[nodiscard]] constexpr bool isValidSymbol(char c, SequenceKind kind) noexcept {
    switch (kind) {
        case SequenceKind::DNA:
            return c == 'A' || c == 'T' || c == 'G' || c == 'C';
        case SequenceKind::RNA:
            return c == 'A' || c == 'U' || c == 'G' || c == 'C';
        case SequenceKind::Protein:
            return std::string_view("ACDEFGHIKLMNPQRSTVWY*").find(c) != std::string_view::npos;
    }
    return false;
}

[[nodiscard]] constexpr bool isNucleotide(SequenceKind kind) noexcept {
    return kind != SequenceKind::Protein;
}

[[nodiscard]] std::string_view toString(SequenceKind kind) noexcept;

/**
 * @brief Parse "dna", "rna" or "protein" (case-insensitive)
 * @throws SequenceError for any other name
 */
[[nodiscard]] SequenceKind parseSequenceKind(std::string_view name);

/**
 * @brief Recover a usable sequence from loosely formatted text
 *
 * Drops FASTA header lines (first non-blank character is '>'), keeps
 * letters only, uppercases, then harmonizes the alphabet: T->U for RNA,
 * U->T for DNA. Does not validate.
 */
[[nodiscard]] std::string normalize(std::string_view raw, SequenceKind kind);

/**
 * @brief True iff the whitespace-stripped, uppercased sequence is a
 *        non-empty string over the alphabet of @p kind
 */
[[nodiscard]] bool validate(std::string_view sequence, SequenceKind kind);

// Keep letters only, uppercased
[[nodiscard]] std::string cleanSequence(std::string_view sequence);

[[nodiscard]] std::string rnaToDna(std::string_view sequence);
[[nodiscard]] std::string dnaToRna(std::string_view sequence);

// True if the sequence should be read as RNA: declared so, or carries U
[[nodiscard]] bool isRnaLike(std::string_view sequence, SequenceKind kind) noexcept;

/**
 * @brief A validated, immutable symbol sequence with its declared kind
 *
 * Every symbol belongs to the alphabet of kind(). Instances are produced
 * from raw text by fromRaw() or from already-clean text by the
 * constructor; analyzers only read them.
 */
class NormalizedSequence {
public:
    /**
     * @throws SequenceError if @p bases holds a symbol outside the
     *         alphabet of @p kind. Empty text is a valid sequence.
     */
    NormalizedSequence(std::string_view bases, SequenceKind kind);

    NormalizedSequence(const NormalizedSequence&) = default;
    NormalizedSequence(NormalizedSequence&&) noexcept = default;
    NormalizedSequence& operator=(const NormalizedSequence&) = default;
    NormalizedSequence& operator=(NormalizedSequence&&) noexcept = default;
    ~NormalizedSequence() = default;

    /**
     * @brief normalize() then validate, the path taken for pasted or
     *        uploaded text
     * @throws SequenceError if a symbol outside the alphabet remains
     */
    [[nodiscard]] static NormalizedSequence fromRaw(std::string_view raw, SequenceKind kind);

    // Getters
    [[nodiscard]] const std::string& bases() const noexcept { return bases_; }
    [[nodiscard]] SequenceKind kind() const noexcept { return kind_; }
    [[nodiscard]] size_t length() const noexcept { return bases_.length(); }
    [[nodiscard]] bool empty() const noexcept { return bases_.empty(); }

    // Iterator support for ranges
    [[nodiscard]] auto begin() const noexcept { return bases_.begin(); }
    [[nodiscard]] auto end() const noexcept { return bases_.end(); }

    // Element access
    [[nodiscard]] char operator[](size_t index) const { return bases_[index]; }
    [[nodiscard]] char at(size_t index) const { return bases_.at(index); }

    [[nodiscard]] bool operator==(const NormalizedSequence& other) const = default;

private:
    std::string bases_;
    SequenceKind kind_;

    static void validateBases(std::string_view bases, SequenceKind kind);
};

// Stream output
std::ostream& operator<<(std::ostream& os, const NormalizedSequence& seq);

} // namespace seqscope
