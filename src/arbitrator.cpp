#include "cifra/arbitrator.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace cifra {

namespace {

// Nine significant digits already exceed any field value.
constexpr std::size_t kMaxSignificantDigits = 9;

std::string percent(double confidence) {
    std::ostringstream out;
    out << static_cast<int>(std::lround(confidence * 100.0)) << "%";
    return out.str();
}

} // namespace

FieldArbitrator::FieldArbitrator(const Lexicon& lexicon, ArbitrationPolicy policy)
    : exact_(lexicon), fuzzy_(lexicon), policy_(policy) {}

std::optional<int> FieldArbitrator::parse_digits(const std::string& text) {
    std::string digits;
    for (unsigned char c : text) {
        if (c >= '0' && c <= '9') {
            digits.push_back(static_cast<char>(c));
        }
    }
    if (digits.empty()) {
        return std::nullopt;
    }
    std::size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return 0;
    }
    digits.erase(0, first);
    if (digits.size() > kMaxSignificantDigits) {
        return std::nullopt;
    }
    return std::stoi(digits);
}

ResolutionResult FieldArbitrator::arbitrate(const std::optional<std::string>& letter_text,
                                            const std::optional<std::string>& digit_text) const {
    ResolutionResult result;
    const std::string letter = letter_text.value_or("");
    const std::string digits = digit_text.value_or("");
    const std::optional<int> digit_value = parse_digits(digits);

    if (auto exact = exact_.convert(letter)) {
        result.value = exact;
        result.confidence = 1.0;
        std::ostringstream why;
        why << "Text '" << letter << "' = " << *exact << ".";
        if (digit_value && *digit_value == *exact) {
            result.method = ResolutionMethod::ExactMatch;
            why << " Digits '" << digits << "' = " << *digit_value << ". They agree.";
        } else {
            result.method = ResolutionMethod::ExactPriority;
            if (digit_value) {
                why << " Digits say " << *digit_value << ", the text takes priority.";
            }
        }
        result.rationale = why.str();
        return result;
    }

    FuzzyMatch fuzzy = fuzzy_.convert(letter);
    if (fuzzy.value && fuzzy.confidence >= policy_.fuzzy_min_confidence) {
        result.value = fuzzy.value;
        std::ostringstream why;
        why << "Corrupted text '" << letter << "' ~ " << *fuzzy.value
            << " (confidence " << percent(fuzzy.confidence) << ").";
        if (digit_value && *digit_value == *fuzzy.value) {
            result.method = ResolutionMethod::FuzzyMatch;
            result.confidence = std::min(fuzzy.confidence, policy_.fuzzy_match_cap);
            why << " Digits confirm.";
        } else {
            result.method = ResolutionMethod::FuzzyPriority;
            result.confidence = std::min(fuzzy.confidence, policy_.fuzzy_priority_cap);
            if (digit_value) {
                why << " Digits say " << *digit_value << ".";
            }
        }
        result.rationale = why.str();
        return result;
    }

    std::ostringstream why;
    if (letter.empty()) {
        why << "No letter form.";
    } else if (fuzzy.value) {
        why << "Text '" << letter << "' ~ " << *fuzzy.value << " only at "
            << percent(fuzzy.confidence) << ".";
    } else {
        why << "Could not convert '" << letter << "'.";
    }
    why << fingerprint_hints(letter);

    result.confidence = 0.0;
    if (digit_value) {
        result.value = digit_value;
        result.method = ResolutionMethod::NeedsEscalation;
        why << " Digits available: '" << digits << "'.";
    } else {
        result.method = ResolutionMethod::Unresolved;
        why << " No digit form.";
    }
    result.rationale = why.str();
    return result;
}

std::string FieldArbitrator::fingerprint_hints(const std::string& letter_text) const {
    std::vector<FingerprintCandidate> candidates = fuzzy_.fingerprint_candidates(letter_text);
    if (candidates.empty()) {
        return "";
    }
    std::ostringstream hints;
    hints << " Fingerprint hints:";
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        hints << (i == 0 ? " " : ", ") << candidates[i].value << " (" << candidates[i].word << ")";
    }
    hints << ".";
    return hints.str();
}

} // namespace cifra
