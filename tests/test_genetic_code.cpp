#include <gtest/gtest.h>
#include "seqscope/genetic_code.hpp"

#include <set>
#include <string>

using namespace seqscope;

// ============================================================================
// Codon Table Tests
// ============================================================================

TEST(GeneticCodeTest, KnownCodons) {
    EXPECT_EQ(genetic_code::lookupCodon("ATG"), 'M');
    EXPECT_EQ(genetic_code::lookupCodon("TTT"), 'F');
    EXPECT_EQ(genetic_code::lookupCodon("TGG"), 'W');
    EXPECT_EQ(genetic_code::lookupCodon("AGA"), 'R');
    EXPECT_EQ(genetic_code::lookupCodon("GGG"), 'G');
    EXPECT_EQ(genetic_code::lookupCodon("CAG"), 'Q');
}

TEST(GeneticCodeTest, StopCodons) {
    EXPECT_EQ(genetic_code::lookupCodon("TAA"), '*');
    EXPECT_EQ(genetic_code::lookupCodon("TAG"), '*');
    EXPECT_EQ(genetic_code::lookupCodon("TGA"), '*');
    EXPECT_TRUE(genetic_code::isStopCodon("TGA"));
    EXPECT_FALSE(genetic_code::isStopCodon("TGG"));
}

TEST(GeneticCodeTest, StartCodon) {
    EXPECT_TRUE(genetic_code::isStartCodon("ATG"));
    EXPECT_FALSE(genetic_code::isStartCodon("GTG"));
}

TEST(GeneticCodeTest, CodonsWithoutEntry) {
    EXPECT_FALSE(genetic_code::lookupCodon("AUG").has_value());
    EXPECT_FALSE(genetic_code::lookupCodon("atg").has_value());
    EXPECT_FALSE(genetic_code::lookupCodon("NNN").has_value());
    EXPECT_FALSE(genetic_code::lookupCodon("AT").has_value());
    EXPECT_FALSE(genetic_code::lookupCodon("ATGA").has_value());
    EXPECT_EQ(genetic_code::translateCodon("ANG"), 'X');
}

TEST(GeneticCodeTest, AllSixtyFourCodonsTranslate) {
    const std::string bases = "TCAG";
    std::set<char> residues;
    size_t stops = 0;

    for (char b1 : bases) {
        for (char b2 : bases) {
            for (char b3 : bases) {
                std::string codon{b1, b2, b3};
                auto aa = genetic_code::lookupCodon(codon);
                ASSERT_TRUE(aa.has_value()) << codon;
                residues.insert(*aa);
                if (*aa == '*') stops++;
            }
        }
    }

    EXPECT_EQ(stops, 3);
    EXPECT_EQ(residues.size(), 21);  // 20 amino acids + stop
}

// ============================================================================
// Amino Acid Table Tests
// ============================================================================

TEST(AminoAcidTest, TableHasTwentyResidues) {
    const auto& table = aminoAcidTable();
    EXPECT_EQ(table.size(), 20);

    std::set<char> codes;
    for (const auto& aa : table) codes.insert(aa.code);
    EXPECT_EQ(codes.size(), 20);
}

TEST(AminoAcidTest, Properties) {
    auto ala = aminoAcidProperties('A');
    ASSERT_TRUE(ala.has_value());
    EXPECT_DOUBLE_EQ(ala->molecular_weight, 89.1);
    EXPECT_DOUBLE_EQ(ala->hydropathy, 1.8);

    auto arg = aminoAcidProperties('R');
    ASSERT_TRUE(arg.has_value());
    EXPECT_DOUBLE_EQ(arg->isoelectric_point, 10.8);
    EXPECT_DOUBLE_EQ(arg->hydropathy, -4.5);
}

TEST(AminoAcidTest, NoEntryForStopOrUnknown) {
    EXPECT_FALSE(aminoAcidProperties('*').has_value());
    EXPECT_FALSE(aminoAcidProperties('X').has_value());
    EXPECT_FALSE(aminoAcidProperties('B').has_value());
}

TEST(AminoAcidTest, ChargeClasses) {
    EXPECT_TRUE(isBasic('R'));
    EXPECT_TRUE(isBasic('K'));
    EXPECT_TRUE(isBasic('H'));
    EXPECT_FALSE(isBasic('D'));
    EXPECT_TRUE(isAcidic('D'));
    EXPECT_TRUE(isAcidic('E'));
    EXPECT_FALSE(isAcidic('K'));
}
