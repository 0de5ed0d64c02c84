#include "seqscope/sequence.hpp"
#include <cctype>
#include <iterator>
#include <ostream>

namespace seqscope {

namespace {

constexpr char toUpper(char c) noexcept {
    if (c >= 'a' && c <= 'z') {
        return static_cast<char>(c - 'a' + 'A');
    }
    return c;
}

constexpr bool isLetter(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isHeaderLine(std::string_view line) noexcept {
    auto first = std::ranges::find_if_not(line, isSpace);
    return first != line.end() && *first == '>';
}

std::string replaceBase(std::string_view sequence, char from, char to) {
    std::string out(sequence);
    std::ranges::replace(out, from, to);
    return out;
}

} // namespace

// ============================================================================
// Sequence Kind
// ============================================================================

std::string_view toString(SequenceKind kind) noexcept {
    switch (kind) {
        case SequenceKind::DNA: return "dna";
        case SequenceKind::RNA: return "rna";
        case SequenceKind::Protein: return "protein";
    }
    return "unknown";
}

SequenceKind parseSequenceKind(std::string_view name) {
    std::string lowered;
    lowered.reserve(name.length());
    std::ranges::transform(name, std::back_inserter(lowered), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    if (lowered == "dna") return SequenceKind::DNA;
    if (lowered == "rna") return SequenceKind::RNA;
    if (lowered == "protein") return SequenceKind::Protein;

    throw SequenceError("Unknown sequence type '" + std::string(name) +
                        "' (expected dna, rna or protein)");
}

// ============================================================================
// Normalization
// ============================================================================

std::string cleanSequence(std::string_view sequence) {
    std::string cleaned;
    cleaned.reserve(sequence.length());

    for (char c : sequence) {
        if (isLetter(c)) {
            cleaned.push_back(toUpper(c));
        }
    }

    return cleaned;
}

std::string normalize(std::string_view raw, SequenceKind kind) {
    std::string seq;
    seq.reserve(raw.length());

    size_t pos = 0;
    while (pos <= raw.length()) {
        size_t eol = raw.find('\n', pos);
        if (eol == std::string_view::npos) eol = raw.length();

        auto line = raw.substr(pos, eol - pos);
        if (!isHeaderLine(line)) {
            seq += cleanSequence(line);
        }
        pos = eol + 1;
    }

    switch (kind) {
        case SequenceKind::RNA:
            std::ranges::replace(seq, 'T', 'U');
            break;
        case SequenceKind::DNA:
            std::ranges::replace(seq, 'U', 'T');
            break;
        case SequenceKind::Protein:
            break;
    }

    return seq;
}

bool validate(std::string_view sequence, SequenceKind kind) {
    size_t symbols = 0;

    for (char c : sequence) {
        if (isSpace(c)) continue;
        if (!isValidSymbol(toUpper(c), kind)) return false;
        ++symbols;
    }

    return symbols > 0;
}

std::string rnaToDna(std::string_view sequence) {
    return replaceBase(sequence, 'U', 'T');
}

std::string dnaToRna(std::string_view sequence) {
    return replaceBase(sequence, 'T', 'U');
}

bool isRnaLike(std::string_view sequence, SequenceKind kind) noexcept {
    return kind == SequenceKind::RNA || sequence.find('U') != std::string_view::npos;
}

// ============================================================================
// NormalizedSequence
// ============================================================================

NormalizedSequence::NormalizedSequence(std::string_view bases, SequenceKind kind)
    : kind_(kind) {
    validateBases(bases, kind);
    bases_ = std::string(bases);
}

NormalizedSequence NormalizedSequence::fromRaw(std::string_view raw, SequenceKind kind) {
    return NormalizedSequence(normalize(raw, kind), kind);
}

void NormalizedSequence::validateBases(std::string_view bases, SequenceKind kind) {
    for (size_t i = 0; i < bases.length(); ++i) {
        if (!isValidSymbol(bases[i], kind)) {
            throw SequenceError("Invalid " + std::string(toString(kind)) + " symbol '" +
                                std::string(1, bases[i]) + "' at position " +
                                std::to_string(i));
        }
    }
}

// ============================================================================
// Stream Output
// ============================================================================

std::ostream& operator<<(std::ostream& os, const NormalizedSequence& seq) {
    os << seq.bases();
    return os;
}

} // namespace seqscope
