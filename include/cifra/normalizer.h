#pragma once

#include <string>
#include <vector>

namespace cifra {

class Normalizer {
public:
    // Lowercase, strip diacritics, keep only a-z and single spaces.
    // "  Veintitrés " -> "veintitres", "Seiscientos  treinta" -> "seiscientos treinta"
    static std::string normalize(const std::string& text);

    // Split normalized text into number words, dropping the connective "y".
    static std::vector<std::string> number_words(const std::string& normalized);
};

} // namespace cifra
