#include "cifra/exact_resolver.h"
#include "cifra/lexicon.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <optional>

using cifra::ExactResolver;
using cifra::Lexicon;

class ExactResolverTest : public ::testing::Test {
protected:
    ExactResolver resolver{Lexicon::spanish()};
};

TEST_F(ExactResolverTest, EveryLexiconWordConverts) {
    for (const auto& entry : Lexicon::spanish().entries()) {
        EXPECT_EQ(resolver.convert(entry.word), std::optional<int>(entry.value)) << entry.word;

        std::string upper = entry.word;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        EXPECT_EQ(resolver.convert("  " + upper + " "), std::optional<int>(entry.value)) << upper;
    }
}

TEST_F(ExactResolverTest, AccentedForms) {
    EXPECT_EQ(resolver.convert("Veintitrés"), 23);
    EXPECT_EQ(resolver.convert("DIECISÉIS"), 16);
    EXPECT_EQ(resolver.convert("veintidós"), 22);
}

TEST_F(ExactResolverTest, Compounds) {
    EXPECT_EQ(resolver.convert("cuatrocientos veintiuno"), 421);
    EXPECT_EQ(resolver.convert("doscientos treinta y seis"), 236);
    EXPECT_EQ(resolver.convert("ciento diez"), 110);
    EXPECT_EQ(resolver.convert("Quinientos cuarenta y cinco"), 545);
    EXPECT_EQ(resolver.convert("Seiscientos treinta y Cinco"), 635);
    EXPECT_EQ(resolver.convert("Novecientos noventa y nueve"), 999);
    EXPECT_EQ(resolver.convert("Treinta y cinco"), 35);
}

TEST_F(ExactResolverTest, OneBadWordInvalidatesCompound) {
    EXPECT_EQ(resolver.convert("cuatrocientos xyz"), std::nullopt);
    EXPECT_EQ(resolver.convert("calorce"), std::nullopt);
    EXPECT_EQ(resolver.convert("treinta y sinco"), std::nullopt);
}

TEST_F(ExactResolverTest, SumsOutsideRangeAreRejected) {
    EXPECT_EQ(resolver.convert("novecientos novecientos"), std::nullopt);
    EXPECT_EQ(resolver.convert("novecientos noventa y nueve uno"), std::nullopt);
}

TEST_F(ExactResolverTest, EmptyAndConnectiveOnly) {
    EXPECT_EQ(resolver.convert(""), std::nullopt);
    EXPECT_EQ(resolver.convert("123"), std::nullopt);
    EXPECT_EQ(resolver.convert("y"), std::nullopt);
}

TEST_F(ExactResolverTest, DanglingConnectiveIsDropped) {
    EXPECT_EQ(resolver.convert("treinta y"), 30);
}
