#include "seqscope/genetic_code.hpp"
#include <algorithm>

namespace seqscope {

namespace {

// Indexed by 16*b1 + 4*b2 + b3 with T=0, C=1, A=2, G=3
constexpr std::string_view kCodonTable =
    "FFLLSSSSYY**CC*W"
    "LLLLPPPPHHQQRRRR"
    "IIIMTTTTNNKKSSRR"
    "VVVVAAAADDEEGGGG";

static_assert(kCodonTable.size() == 64);

constexpr int baseIndex(char base) noexcept {
    switch (base) {
        case 'T': return 0;
        case 'C': return 1;
        case 'A': return 2;
        case 'G': return 3;
        default: return -1;
    }
}

constexpr std::array<AminoAcidProperties, kStandardAminoAcids> kAminoAcids = {{
    {'A',  89.1,  6.0,  1.8},
    {'R', 174.2, 10.8, -4.5},
    {'N', 132.1,  5.4, -3.5},
    {'D', 133.1,  2.8, -3.5},
    {'C', 121.2,  5.1,  2.5},
    {'Q', 146.1,  5.7, -3.5},
    {'E', 147.1,  4.3, -3.5},
    {'G',  75.1,  6.0, -0.4},
    {'H', 155.2,  7.6, -3.2},
    {'I', 131.2,  6.0,  4.5},
    {'L', 131.2,  6.0,  3.8},
    {'K', 146.2,  9.7, -3.9},
    {'M', 149.2,  5.7,  1.9},
    {'F', 165.2,  5.5,  2.8},
    {'P', 115.1,  6.3, -1.6},
    {'S', 105.1,  5.7, -0.8},
    {'T', 119.1,  5.6, -0.7},
    {'W', 204.2,  5.9, -0.9},
    {'Y', 181.2,  5.7, -1.3},
    {'V', 117.1,  6.0,  4.2},
}};

} // namespace

namespace genetic_code {

std::optional<char> lookupCodon(std::string_view codon) noexcept {
    if (codon.length() != 3) return std::nullopt;

    int index = 0;
    for (char base : codon) {
        int b = baseIndex(base);
        if (b < 0) return std::nullopt;
        index = index * 4 + b;
    }

    return kCodonTable[static_cast<size_t>(index)];
}

char translateCodon(std::string_view codon) noexcept {
    return lookupCodon(codon).value_or(kUnknown);
}

bool isStopCodon(std::string_view codon) noexcept {
    return lookupCodon(codon) == kStop;
}

bool isStartCodon(std::string_view codon) noexcept {
    return codon == kStartCodon;
}

} // namespace genetic_code

const std::array<AminoAcidProperties, kStandardAminoAcids>& aminoAcidTable() noexcept {
    return kAminoAcids;
}

std::optional<AminoAcidProperties> aminoAcidProperties(char residue) noexcept {
    auto it = std::ranges::find(kAminoAcids, residue, &AminoAcidProperties::code);
    if (it == kAminoAcids.end()) return std::nullopt;
    return *it;
}

} // namespace seqscope
