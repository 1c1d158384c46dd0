#pragma once

#include "types.h"

#include <string>
#include <vector>

namespace cifra {

// Best-effort split of a field's OCR tokens into its letter form and digit
// form. With more than two tokens in a field it can pick the wrong ones
// (an identifier column read as the digit form, for instance).
class EvidenceClassifier {
public:
    static constexpr double kMinDigitRatio = 0.70;
    static constexpr std::size_t kMinLetters = 3;

    // Removes OCR selection marks (":selected:", "○", "✓", ...) and trims.
    static std::string clean_token(const std::string& raw);

    // digit_text: first token whose visible characters are >= 70% digits.
    // letter_text: longest token with at least three alphabetic characters.
    static Evidence classify(const std::vector<std::string>& contents);
};

} // namespace cifra
