#include "cifra/exact_resolver.h"
#include "cifra/normalizer.h"
#include "cifra/types.h"

namespace cifra {

std::optional<int> ExactResolver::convert(const std::string& text) const {
    std::string normalized = Normalizer::normalize(text);
    if (normalized.empty()) {
        return std::nullopt;
    }

    if (const LexiconEntry* entry = lexicon_.find(normalized)) {
        return entry->value;
    }

    return sum_words(Normalizer::number_words(normalized));
}

std::optional<int> ExactResolver::sum_words(const std::vector<std::string>& words) const {
    if (words.empty()) {
        return std::nullopt;
    }
    long long total = 0;
    for (const auto& word : words) {
        const LexiconEntry* entry = lexicon_.find(word);
        if (!entry) {
            return std::nullopt;
        }
        total += entry->value;
    }
    // "novecientos novecientos" parses but is not a field value
    if (!in_field_range(total)) {
        return std::nullopt;
    }
    return static_cast<int>(total);
}

} // namespace cifra
