#include "cifra/fuzzy_resolver.h"
#include "cifra/normalizer.h"
#include "cifra/types.h"

#include <algorithm>
#include <limits>

namespace cifra {

std::size_t edit_distance(const std::string& a, const std::string& b) {
    const std::size_t la = a.size();
    const std::size_t lb = b.size();
    if (la == 0) {
        return lb;
    }
    if (lb == 0) {
        return la;
    }
    // Two-row DP
    std::vector<std::size_t> prev(lb + 1), curr(lb + 1);
    for (std::size_t j = 0; j <= lb; ++j) {
        prev[j] = j;
    }
    for (std::size_t i = 1; i <= la; ++i) {
        curr[0] = i;
        for (std::size_t j = 1; j <= lb; ++j) {
            std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[lb];
}

FuzzyMatch FuzzyResolver::convert(const std::string& text) const {
    std::string normalized = Normalizer::normalize(text);
    if (normalized.empty()) {
        return FuzzyMatch::none();
    }

    if (auto exact = exact_.convert(text)) {
        return FuzzyMatch{exact, 1.0};
    }

    std::vector<std::string> words = Normalizer::number_words(normalized);
    if (words.empty()) {
        return FuzzyMatch::none();
    }
    if (words.size() == 1) {
        return match_word(words.front());
    }

    long long total = 0;
    double weakest = 1.0;
    for (const auto& word : words) {
        if (const LexiconEntry* entry = lexicon_.find(word)) {
            total += entry->value;
            continue;
        }
        FuzzyMatch part = match_word(word);
        if (!part.value) {
            return FuzzyMatch::none();
        }
        total += *part.value;
        weakest = std::min(weakest, part.confidence);
    }
    if (!in_field_range(total)) {
        return FuzzyMatch::none();
    }
    return FuzzyMatch{static_cast<int>(total), weakest};
}

FuzzyMatch FuzzyResolver::match_word(const std::string& token) const {
    if (token.empty()) {
        return FuzzyMatch::none();
    }

    // Nearest word by edit distance; the strict '<' keeps the earliest
    // lexicon entry among equal distances.
    const LexiconEntry* best = nullptr;
    std::size_t best_distance = std::numeric_limits<std::size_t>::max();
    for (const auto& entry : lexicon_.entries()) {
        double ratio = static_cast<double>(token.size()) / static_cast<double>(std::max<std::size_t>(entry.length, 1));
        if (ratio < kMinLengthRatio || ratio > kMaxLengthRatio) {
            continue;
        }
        std::size_t distance = edit_distance(token, entry.word);
        if (distance < best_distance) {
            best = &entry;
            best_distance = distance;
        }
    }
    if (!best) {
        return FuzzyMatch::none();
    }

    const std::size_t word_length = std::max<std::size_t>(best->length, 1);
    std::size_t max_distance = std::max(kMinMaxDistance,
                                        static_cast<std::size_t>(static_cast<double>(best->length) * kMaxDistanceShare));
    if (best_distance > max_distance) {
        return fingerprint_fallback(token);
    }

    double confidence = std::max(kMinEditConfidence,
                                 1.0 - static_cast<double>(best_distance) / static_cast<double>(word_length));
    if (Fingerprint::of(token) == best->fingerprint()) {
        confidence = std::min(1.0, confidence + kFingerprintBonus);
    }
    return FuzzyMatch{best->value, confidence};
}

FuzzyMatch FuzzyResolver::fingerprint_fallback(const std::string& token) const {
    if (token.size() < 2) {
        return FuzzyMatch::none();
    }
    if (const LexiconEntry* entry = lexicon_.unique_fingerprint(Fingerprint::of(token))) {
        return FuzzyMatch{entry->value, kFingerprintConfidence};
    }
    return FuzzyMatch::none();
}

std::vector<FingerprintCandidate> FuzzyResolver::fingerprint_candidates(const std::string& text) const {
    std::vector<FingerprintCandidate> candidates;
    std::vector<std::string> words;
    for (auto& word : Normalizer::number_words(Normalizer::normalize(text))) {
        if (word.size() >= 2) {
            words.push_back(std::move(word));
        }
    }
    if (words.size() != 1) {
        return candidates;
    }

    const Fingerprint fp = Fingerprint::of(words.front());
    for (const LexiconEntry* entry : lexicon_.by_fingerprint(fp)) {
        candidates.push_back({entry->word, entry->value, kFingerprintConfidence});
    }
    if (!candidates.empty()) {
        return candidates;
    }

    for (std::size_t length : {fp.length - 1, fp.length + 1}) {
        for (const LexiconEntry* entry : lexicon_.by_fingerprint(Fingerprint{length, fp.first, fp.last})) {
            candidates.push_back({entry->word, entry->value, kNearFingerprintConfidence});
        }
    }
    return candidates;
}

} // namespace cifra
