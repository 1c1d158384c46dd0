#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cifra {

// Coarse word signature: (length, first letter, last letter).
struct Fingerprint {
    std::size_t length = 0;
    char first = '\0';
    char last = '\0';

    bool operator==(const Fingerprint& other) const {
        return length == other.length && first == other.first && last == other.last;
    }

    // Empty words have no fingerprint; callers check length first.
    static Fingerprint of(const std::string& word) {
        if (word.empty()) {
            return Fingerprint{};
        }
        return Fingerprint{word.size(), word.front(), word.back()};
    }
};

struct FingerprintHash {
    std::size_t operator()(const Fingerprint& fp) const {
        std::size_t h = std::hash<std::size_t>()(fp.length);
        h = h * 31 + static_cast<unsigned char>(fp.first);
        h = h * 31 + static_cast<unsigned char>(fp.last);
        return h;
    }
};

struct LexiconEntry {
    std::string word;      // lowercase, accent-free, a-z only
    int value = 0;         // 0..999
    std::size_t length = 0;
    char first_char = '\0';
    char last_char = '\0';

    Fingerprint fingerprint() const { return Fingerprint{length, first_char, last_char}; }
};

// Spanish cardinal words 0-999 with a fingerprint index. Built once, then
// only read; a const Lexicon is safe to share between threads.
class Lexicon {
public:
    Lexicon() = default;
    explicit Lexicon(const std::vector<std::pair<std::string, int>>& words);

    // Process-wide built-in table.
    static const Lexicon& spanish();

    // Merge extra words from an XML lexicon file. Meant to be called at
    // startup before the lexicon is shared.
    bool load_external(const std::string& lexicon_file);

    // Adds (or overrides) one word. Returns false if the word does not
    // normalize to a single a-z word or the value is out of range.
    bool add(const std::string& word, int value);

    const LexiconEntry* find(const std::string& word) const;

    // All entries sharing the fingerprint, in table order.
    std::vector<const LexiconEntry*> by_fingerprint(const Fingerprint& fp) const;

    // The entry if exactly one word has this fingerprint.
    const LexiconEntry* unique_fingerprint(const Fingerprint& fp) const;

    // Entries in table order; fuzzy tie-breaks follow this order.
    const std::vector<LexiconEntry>& entries() const { return entries_; }

    std::size_t size() const { return entries_.size(); }
    std::size_t fingerprint_count() const { return fingerprints_.size(); }
    std::size_t unique_fingerprint_count() const;

    // "57 words, 43 fingerprints (31 unique)"
    std::string info() const;

private:
    std::vector<LexiconEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;  // word -> position in entries_
    // Positions rather than pointers so that copies stay valid.
    std::unordered_map<Fingerprint, std::vector<std::size_t>, FingerprintHash> fingerprints_;
};

} // namespace cifra
