#include "cifra/normalizer.h"
#include "cifra/unicode_utils.h"

#include <sstream>

namespace cifra {

namespace {
using cifra::unicode::strip_diacritics;
using cifra::unicode::to_unicode_string;
} // namespace

std::string Normalizer::normalize(const std::string& text) {
    if (text.empty()) {
        return "";
    }

    icu::UnicodeString ustr = to_unicode_string(text);
    ustr.toLower();
    ustr = strip_diacritics(ustr);

    std::string result;
    result.reserve(static_cast<size_t>(ustr.length()));
    bool pending_space = false;
    for (int32_t i = 0; i < ustr.length();) {
        UChar32 c = ustr.char32At(i);
        i += U16_LENGTH(c);
        if (u_isUWhiteSpace(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (c < 'a' || c > 'z') {
            // Dropped without breaking the word: "veinti-cinco" -> "veinticinco"
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(static_cast<char>(c));
    }
    return result;
}

std::vector<std::string> Normalizer::number_words(const std::string& normalized) {
    std::vector<std::string> words;
    std::istringstream stream(normalized);
    std::string word;
    while (stream >> word) {
        if (word == "y") {
            continue;
        }
        words.push_back(word);
    }
    return words;
}

} // namespace cifra
