#pragma once

#include "exact_resolver.h"
#include "lexicon.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cifra {

struct FuzzyMatch {
    std::optional<int> value;
    double confidence = 0.0;

    static FuzzyMatch none() { return FuzzyMatch{}; }
};

struct FingerprintCandidate {
    std::string word;
    int value = 0;
    double confidence = 0.0;
};

// Levenshtein distance over bytes (normalized text is plain a-z).
std::size_t edit_distance(const std::string& a, const std::string& b);

// Tolerates OCR/spelling corruption: nearest lexicon word by edit distance,
// falling back to the fingerprint when the nearest word is too far.
class FuzzyResolver {
public:
    // Only words whose length ratio to the token is inside this band are compared.
    static constexpr double kMinLengthRatio = 0.65;
    static constexpr double kMaxLengthRatio = 1.50;
    static constexpr double kMaxDistanceShare = 0.35;
    static constexpr std::size_t kMinMaxDistance = 2;
    static constexpr double kMinEditConfidence = 0.50;
    static constexpr double kFingerprintBonus = 0.10;
    static constexpr double kFingerprintConfidence = 0.65;
    static constexpr double kNearFingerprintConfidence = 0.50;

    explicit FuzzyResolver(const Lexicon& lexicon) : lexicon_(lexicon), exact_(lexicon) {}

    // Exact first (confidence 1.0), then word-by-word fuzzy; a compound takes
    // the confidence of its weakest word.
    FuzzyMatch convert(const std::string& text) const;

    // One normalized token.
    FuzzyMatch match_word(const std::string& token) const;

    // Every word sharing the text's fingerprint (0.65), else words one letter
    // longer or shorter with the same first/last letter (0.50).
    std::vector<FingerprintCandidate> fingerprint_candidates(const std::string& text) const;

private:
    const Lexicon& lexicon_;
    ExactResolver exact_;

    FuzzyMatch fingerprint_fallback(const std::string& token) const;
};

} // namespace cifra
