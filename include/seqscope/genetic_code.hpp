#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace seqscope {

/**
 * @brief Standard genetic code (NCBI translation table 1)
 *
 * Codons are DNA triplets over {T,C,A,G}; RNA input must be converted
 * with rnaToDna() first. Stops translate to '*'.
 */
namespace genetic_code {

inline constexpr char kStop = '*';
inline constexpr char kUnknown = 'X';
inline constexpr std::string_view kStartCodon = "ATG";

/**
 * @brief Amino acid for a codon, or nullopt if @p codon is not a DNA
 *        triplet (wrong length, lowercase, ambiguity symbol)
 */
[[nodiscard]] std::optional<char> lookupCodon(std::string_view codon) noexcept;

// Like lookupCodon, but unknown codons become 'X'
[[nodiscard]] char translateCodon(std::string_view codon) noexcept;

[[nodiscard]] bool isStopCodon(std::string_view codon) noexcept;
[[nodiscard]] bool isStartCodon(std::string_view codon) noexcept;

} // namespace genetic_code

/**
 * @brief Physicochemical constants for one of the 20 standard residues
 */
struct AminoAcidProperties {
    char code;
    double molecular_weight;   // Da, free amino acid
    double isoelectric_point;  // pI of the free amino acid
    double hydropathy;         // Kyte-Doolittle
};

inline constexpr size_t kStandardAminoAcids = 20;

// The fixed residue table, in the order A R N D C Q E G H I L K M F P S T W Y V
[[nodiscard]] const std::array<AminoAcidProperties, kStandardAminoAcids>& aminoAcidTable() noexcept;

/**
 * @brief Properties of a residue, nullopt for '*', 'X' and anything
 *        outside the 20 standard one-letter codes
 */
[[nodiscard]] std::optional<AminoAcidProperties> aminoAcidProperties(char residue) noexcept;

[[nodiscard]] constexpr bool isBasic(char residue) noexcept {
    return residue == 'R' || residue == 'K' || residue == 'H';
}

[[nodiscard]] constexpr bool isAcidic(char residue) noexcept {
    return residue == 'D' || residue == 'E';
}

} // namespace seqscope
