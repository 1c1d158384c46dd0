#pragma once

#include "lexicon.h"

#include <optional>
#include <string>
#include <vector>

namespace cifra {

// Whole-word and additive compound parsing; no error tolerance.
class ExactResolver {
public:
    explicit ExactResolver(const Lexicon& lexicon) : lexicon_(lexicon) {}

    // "Quinientos cuarenta y cinco" -> 545, "veintitrés" -> 23.
    // Any word outside the lexicon, or a sum outside 0..999, gives nullopt.
    std::optional<int> convert(const std::string& text) const;

    // Sum of already normalized words, all of which must be exact hits.
    std::optional<int> sum_words(const std::vector<std::string>& words) const;

private:
    const Lexicon& lexicon_;
};

} // namespace cifra
