#include "cifra/arbitrator.h"
#include "cifra/lexicon.h"

#include <gtest/gtest.h>

using cifra::ArbitrationPolicy;
using cifra::FieldArbitrator;
using cifra::Lexicon;
using cifra::ResolutionMethod;
using cifra::ResolutionResult;

class ArbitratorTest : public ::testing::Test {
protected:
    FieldArbitrator arbitrator{Lexicon::spanish()};
};

TEST(ParseDigitsTest, StripsEverythingButDigits) {
    EXPECT_EQ(FieldArbitrator::parse_digits("035"), 35);
    EXPECT_EQ(FieldArbitrator::parse_digits("5 0"), 50);
    EXPECT_EQ(FieldArbitrator::parse_digits("(545)"), 545);
    EXPECT_EQ(FieldArbitrator::parse_digits("000"), 0);
    EXPECT_EQ(FieldArbitrator::parse_digits("0000000000007"), 7);
    EXPECT_EQ(FieldArbitrator::parse_digits("abc"), std::nullopt);
    EXPECT_EQ(FieldArbitrator::parse_digits(""), std::nullopt);
    EXPECT_EQ(FieldArbitrator::parse_digits("12345678901"), std::nullopt);
}

TEST_F(ArbitratorTest, ExactTextAgreesWithDigits) {
    ResolutionResult result = arbitrator.arbitrate(std::string("quinientos cuarenta y cinco"), std::string("545"));
    EXPECT_EQ(result.value, 545);
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    EXPECT_EQ(result.method, ResolutionMethod::ExactMatch);
}

TEST_F(ArbitratorTest, ExactTextWinsOverDigits) {
    ResolutionResult result = arbitrator.arbitrate(std::string("quinientos cuarenta y cinco"), std::string("544"));
    EXPECT_EQ(result.value, 545);
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    EXPECT_EQ(result.method, ResolutionMethod::ExactPriority);
    EXPECT_NE(result.rationale.find("544"), std::string::npos);
}

TEST_F(ArbitratorTest, ExactTextWithoutDigits) {
    ResolutionResult result = arbitrator.arbitrate(std::string("Cien"), std::nullopt);
    EXPECT_EQ(result.value, 100);
    EXPECT_EQ(result.method, ResolutionMethod::ExactPriority);
}

TEST_F(ArbitratorTest, LeadingZerosInDigits) {
    ResolutionResult result = arbitrator.arbitrate(std::string("Treinta y Cinco"), std::string("035"));
    EXPECT_EQ(result.value, 35);
    EXPECT_EQ(result.method, ResolutionMethod::ExactMatch);
}

TEST_F(ArbitratorTest, FuzzyConfirmedByDigitsIsCapped) {
    ResolutionResult result = arbitrator.arbitrate(std::string("Calorce"), std::string("14"));
    EXPECT_EQ(result.value, 14);
    EXPECT_DOUBLE_EQ(result.confidence, 0.95);
    EXPECT_EQ(result.method, ResolutionMethod::FuzzyMatch);
}

TEST_F(ArbitratorTest, FuzzyAgainstDigitsIsCappedLower) {
    ResolutionResult result = arbitrator.arbitrate(std::string("Calorce"), std::string("11"));
    EXPECT_EQ(result.value, 14);
    EXPECT_DOUBLE_EQ(result.confidence, 0.85);
    EXPECT_EQ(result.method, ResolutionMethod::FuzzyPriority);
}

TEST_F(ArbitratorTest, FuzzyBelowCapKeepsItsConfidence) {
    ResolutionResult result = arbitrator.arbitrate(std::string("sinc"), std::string("85"));
    EXPECT_EQ(result.value, 5);
    EXPECT_NEAR(result.confidence, 0.6, 1e-9);
    EXPECT_EQ(result.method, ResolutionMethod::FuzzyPriority);
}

TEST_F(ArbitratorTest, WeakFuzzyFallsBackToDigits) {
    ResolutionResult result = arbitrator.arbitrate(std::string("uxx"), std::string("1"));
    EXPECT_EQ(result.value, 1);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_EQ(result.method, ResolutionMethod::NeedsEscalation);
}

TEST_F(ArbitratorTest, UnparseableTextWithDigitsNeedsEscalation) {
    ResolutionResult result = arbitrator.arbitrate(std::string("xqzwvkj"), std::string("25"));
    EXPECT_EQ(result.value, 25);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_EQ(result.method, ResolutionMethod::NeedsEscalation);
}

TEST_F(ArbitratorTest, DigitsOnly) {
    ResolutionResult result = arbitrator.arbitrate(std::nullopt, std::string("7"));
    EXPECT_EQ(result.value, 7);
    EXPECT_EQ(result.method, ResolutionMethod::NeedsEscalation);
}

TEST_F(ArbitratorTest, NoEvidence) {
    ResolutionResult result = arbitrator.arbitrate(std::nullopt, std::nullopt);
    EXPECT_FALSE(result.value.has_value());
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_EQ(result.method, ResolutionMethod::Unresolved);

    ResolutionResult garbage = arbitrator.arbitrate(std::string("xqzwvkj"), std::nullopt);
    EXPECT_FALSE(garbage.value.has_value());
    EXPECT_EQ(garbage.method, ResolutionMethod::Unresolved);
}

TEST_F(ArbitratorTest, EscalationRationaleCarriesFingerprintHints) {
    ResolutionResult result = arbitrator.arbitrate(std::string("qxxxxxxxxs"), std::string("12"));
    EXPECT_EQ(result.method, ResolutionMethod::NeedsEscalation);
    EXPECT_NE(result.rationale.find("500 (quinientos)"), std::string::npos) << result.rationale;
}

TEST_F(ArbitratorTest, EvidenceOverload) {
    cifra::Evidence evidence;
    evidence.letter_text = "veinisinco";
    evidence.digit_text = "25";
    ResolutionResult result = arbitrator.arbitrate(evidence);
    EXPECT_EQ(result.value, 25);
    EXPECT_EQ(result.method, ResolutionMethod::FuzzyMatch);
    EXPECT_NEAR(result.confidence, 1.0 - 2.0 / 11.0, 1e-9);
}

TEST(ArbitratorPolicyTest, StricterFuzzyThreshold) {
    ArbitrationPolicy policy;
    policy.fuzzy_min_confidence = 0.90;
    FieldArbitrator strict(Lexicon::spanish(), policy);
    ResolutionResult result = strict.arbitrate(std::string("veinisinco"), std::string("25"));
    EXPECT_EQ(result.method, ResolutionMethod::NeedsEscalation);
    EXPECT_EQ(result.value, 25);
}
