#include "cifra/evidence.h"
#include "cifra/unicode_utils.h"

namespace cifra {

namespace {

const std::vector<std::string>& selection_marks() {
    static const std::vector<std::string> marks = {
        ":unselected:", ":selected:", "○", "□", "✓", "—", "@"
    };
    return marks;
}

void erase_all(std::string& text, const std::string& needle) {
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.erase(pos, needle.size());
    }
}

} // namespace

std::string EvidenceClassifier::clean_token(const std::string& raw) {
    std::string cleaned = raw;
    for (const auto& mark : selection_marks()) {
        erase_all(cleaned, mark);
    }
    return unicode::trim(cleaned);
}

Evidence EvidenceClassifier::classify(const std::vector<std::string>& contents) {
    Evidence evidence;
    std::size_t longest_letters = 0;

    for (const auto& raw : contents) {
        std::string token = clean_token(raw);
        if (token.empty()) {
            continue;
        }
        unicode::CharClassCounts counts = unicode::classify_chars(token);
        if (counts.visible == 0) {
            continue;
        }

        if (!evidence.digit_text &&
            static_cast<double>(counts.digits) / static_cast<double>(counts.visible) >= kMinDigitRatio) {
            evidence.digit_text = token;
        }

        if (counts.alphabetic >= kMinLetters) {
            std::size_t length = unicode::char_count(token);
            if (length > longest_letters) {
                longest_letters = length;
                evidence.letter_text = token;
            }
        }
    }
    return evidence;
}

} // namespace cifra
