#include <gtest/gtest.h>
#include "seqscope/protein.hpp"

#include <string>
#include <vector>

using namespace seqscope;

// ============================================================================
// Translation Tests
// ============================================================================

TEST(TranslateTest, KeepsStopSymbols) {
    auto result = translate("ATGAAATAG", 0, SequenceKind::DNA);

    EXPECT_EQ(result.protein, "MK*");
    EXPECT_EQ(result.length(), 3);
    EXPECT_EQ(result.frame, 0);
}

TEST(TranslateTest, Properties) {
    auto result = translate("ATGAAATAG");

    EXPECT_EQ(result.properties.length, 3);
    EXPECT_DOUBLE_EQ(result.properties.molecular_weight, 295.4);
    EXPECT_DOUBLE_EQ(result.properties.isoelectric_point, 7.5);
    EXPECT_DOUBLE_EQ(result.properties.hydropathy, -1.0);
    EXPECT_EQ(result.properties.composition.getCount("*"), 1);
}

TEST(TranslateTest, FrameOffsets) {
    EXPECT_EQ(translate("AATGAAATAG", 1).protein, "MK*");
    EXPECT_EQ(translate("ATGAAATAG", 2).protein, "EI");
}

TEST(TranslateTest, ThrowsOnInvalidFrame) {
    EXPECT_THROW((void)translate("ATGAAATAG", 3), SequenceError);
}

TEST(TranslateTest, RnaInput) {
    EXPECT_EQ(translate("AUGAAAUAG", 0, SequenceKind::RNA).protein, "MK*");
    // U present, declared kind notwithstanding
    EXPECT_EQ(translate("AUGUUU", 0, SequenceKind::DNA).protein, "MF");
}

TEST(TranslateTest, UnknownCodonBecomesX) {
    auto result = translate("ATGNNNAAA");

    EXPECT_EQ(result.protein, "MXK");
    EXPECT_EQ(result.properties.composition.getCount("X"), 1);
    EXPECT_DOUBLE_EQ(result.properties.molecular_weight, 295.4);
    EXPECT_DOUBLE_EQ(result.properties.hydropathy, -1.0);
}

TEST(TranslateTest, EmptyAndShortInput) {
    auto empty = translate("");
    EXPECT_TRUE(empty.protein.empty());
    EXPECT_DOUBLE_EQ(empty.properties.molecular_weight, 0.0);
    EXPECT_DOUBLE_EQ(empty.properties.isoelectric_point, 7.0);
    EXPECT_DOUBLE_EQ(empty.properties.hydropathy, 0.0);

    EXPECT_TRUE(translate("AT").protein.empty());
    EXPECT_TRUE(translate("ATG", 1).protein.empty());
}

TEST(TranslateTest, AllFrames) {
    auto frames = translateAllFrames("ATGAAATAG");

    EXPECT_EQ(frames[0].protein, "MK*");
    EXPECT_EQ(frames[1].protein, "*N");
    EXPECT_EQ(frames[2].protein, "EI");
    EXPECT_EQ(frames[0].frame, 0);
    EXPECT_EQ(frames[1].frame, 1);
    EXPECT_EQ(frames[2].frame, 2);
}

TEST(TranslateTest, NormalizedSequenceOverload) {
    NormalizedSequence seq("AUGGCC", SequenceKind::RNA);
    EXPECT_EQ(translate(seq).protein, "MA");
}

TEST(TranslateTest, EmptyNormalizedSequence) {
    auto result = translate(NormalizedSequence("", SequenceKind::DNA));
    EXPECT_TRUE(result.protein.empty());
    EXPECT_DOUBLE_EQ(result.properties.isoelectric_point, 7.0);
}

// ============================================================================
// Protein Property Tests
// ============================================================================

TEST(ProteinPropertiesTest, ChargedResidues) {
    auto props = proteinProperties("RKHDE");

    EXPECT_EQ(props.length, 5);
    EXPECT_DOUBLE_EQ(props.isoelectric_point, 7.5);
    EXPECT_NEAR(props.molecular_weight, 755.8, 1e-9);
    EXPECT_NEAR(props.hydropathy, -3.72, 1e-9);
}

TEST(ProteinPropertiesTest, AcidicProteinLowersEstimate) {
    EXPECT_DOUBLE_EQ(proteinProperties("DDDD").isoelectric_point, 5.0);
    EXPECT_DOUBLE_EQ(proteinProperties("GAVL").isoelectric_point, 7.0);
}

TEST(ProteinPropertiesTest, StopExcludedFromAverages) {
    auto props = proteinProperties("I*I");

    EXPECT_EQ(props.length, 3);
    EXPECT_DOUBLE_EQ(props.molecular_weight, 262.4);
    EXPECT_DOUBLE_EQ(props.hydropathy, 4.5);
}

TEST(ProteinPropertiesTest, CompositionInFirstSeenOrder) {
    auto props = proteinProperties("MKVMK");

    std::vector<std::string> keys;
    for (const auto& entry : props.composition) keys.push_back(entry.key);

    EXPECT_EQ(keys, (std::vector<std::string>{"M", "K", "V"}));
    EXPECT_EQ(props.composition.getCount("M"), 2);
    EXPECT_EQ(props.composition.getCount("V"), 1);
}

TEST(ProteinPropertiesTest, MatchesTranslationProperties) {
    auto translated = translate("ATGCGTGATGAATGGTAA");
    auto direct = proteinProperties(translated.protein);

    EXPECT_DOUBLE_EQ(direct.molecular_weight, translated.properties.molecular_weight);
    EXPECT_DOUBLE_EQ(direct.isoelectric_point, translated.properties.isoelectric_point);
    EXPECT_DOUBLE_EQ(direct.hydropathy, translated.properties.hydropathy);
}

TEST(ProteinPropertiesTest, NormalizedSequenceOverload) {
    NormalizedSequence seq("KKKK", SequenceKind::Protein);
    EXPECT_DOUBLE_EQ(proteinProperties(seq).isoelectric_point, 9.0);
}
