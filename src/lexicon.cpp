#include "cifra/lexicon.h"
#include "cifra/normalizer.h"
#include "cifra/types.h"

#include <pugixml.hpp>

#include <iostream>
#include <sstream>

namespace cifra {

namespace {

// Order matters: equal-distance fuzzy matches resolve to the earliest word.
const std::vector<std::pair<std::string, int>>& builtin_words() {
    static const std::vector<std::pair<std::string, int>> words = {
        // units
        {"cero", 0}, {"uno", 1}, {"una", 1}, {"dos", 2}, {"tres", 3},
        {"cuatro", 4}, {"cinco", 5}, {"seis", 6}, {"siete", 7}, {"ocho", 8},
        {"nueve", 9},
        // 10-19
        {"diez", 10}, {"once", 11}, {"doce", 12}, {"trece", 13}, {"catorce", 14},
        {"quince", 15}, {"dieciseis", 16}, {"diecisiete", 17}, {"dieciocho", 18},
        {"diecinueve", 19},
        // 20-29
        {"veinte", 20}, {"veintiuno", 21}, {"veintiuna", 21}, {"veintidos", 22},
        {"veintitres", 23}, {"veinticuatro", 24}, {"veinticinco", 25},
        {"veintiseis", 26}, {"veintisiete", 27}, {"veintiocho", 28},
        {"veintinueve", 29},
        // tens
        {"treinta", 30}, {"cuarenta", 40}, {"cincuenta", 50}, {"sesenta", 60},
        {"setenta", 70}, {"ochenta", 80}, {"noventa", 90},
        // hundreds; "cien" stands alone, "ciento" takes a complement
        {"cien", 100}, {"ciento", 100},
        {"doscientos", 200}, {"doscientas", 200},
        {"trescientos", 300}, {"trescientas", 300},
        {"cuatrocientos", 400}, {"cuatrocientas", 400},
        {"quinientos", 500}, {"quinientas", 500},
        {"seiscientos", 600}, {"seiscientas", 600},
        {"setecientos", 700}, {"setecientas", 700},
        {"ochocientos", 800}, {"ochocientas", 800},
        {"novecientos", 900}, {"novecientas", 900},
    };
    return words;
}

} // namespace

Lexicon::Lexicon(const std::vector<std::pair<std::string, int>>& words) {
    for (const auto& [word, value] : words) {
        if (!add(word, value)) {
            std::cerr << "[cifra] Warning: lexicon word rejected: '" << word << "' = " << value << std::endl;
        }
    }
}

const Lexicon& Lexicon::spanish() {
    static const Lexicon lexicon(builtin_words());
    return lexicon;
}

bool Lexicon::add(const std::string& word, int value) {
    if (!in_field_range(value)) {
        return false;
    }
    std::string key = Normalizer::normalize(word);
    if (key.empty() || key.find(' ') != std::string::npos || key == "y") {
        return false;
    }

    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].value = value;
        return true;
    }

    LexiconEntry entry;
    entry.word = key;
    entry.value = value;
    entry.length = key.size();
    entry.first_char = key.front();
    entry.last_char = key.back();

    std::size_t position = entries_.size();
    fingerprints_[entry.fingerprint()].push_back(position);
    index_[key] = position;
    entries_.push_back(std::move(entry));
    return true;
}

bool Lexicon::load_external(const std::string& lexicon_file) {
    if (lexicon_file.empty()) {
        return true;
    }
    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_file(lexicon_file.c_str());
    if (!parsed) {
        std::cerr << "[cifra] Error: Cannot load lexicon file " << lexicon_file
                  << ": " << parsed.description() << std::endl;
        return false;
    }
    pugi::xml_node lexicon_node = doc.child("cifra").child("lexicon");
    if (!lexicon_node) {
        std::cerr << "[cifra] Error: " << lexicon_file << " has no <cifra><lexicon> element" << std::endl;
        return false;
    }
    for (auto node : lexicon_node.children("item")) {
        std::string key = node.attribute("key").value();
        if (!node.attribute("value")) {
            std::cerr << "[cifra] Warning: lexicon item '" << key << "' has no value, skipped" << std::endl;
            continue;
        }
        int value = node.attribute("value").as_int(-1);
        if (!add(key, value)) {
            std::cerr << "[cifra] Warning: lexicon item '" << key << "' = " << value << " rejected" << std::endl;
        }
    }
    return true;
}

const LexiconEntry* Lexicon::find(const std::string& word) const {
    auto it = index_.find(word);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::vector<const LexiconEntry*> Lexicon::by_fingerprint(const Fingerprint& fp) const {
    std::vector<const LexiconEntry*> result;
    auto it = fingerprints_.find(fp);
    if (it == fingerprints_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (std::size_t position : it->second) {
        result.push_back(&entries_[position]);
    }
    return result;
}

const LexiconEntry* Lexicon::unique_fingerprint(const Fingerprint& fp) const {
    auto it = fingerprints_.find(fp);
    if (it == fingerprints_.end() || it->second.size() != 1) {
        return nullptr;
    }
    return &entries_[it->second.front()];
}

std::size_t Lexicon::unique_fingerprint_count() const {
    std::size_t unique = 0;
    for (const auto& [fp, positions] : fingerprints_) {
        if (positions.size() == 1) {
            ++unique;
        }
    }
    return unique;
}

std::string Lexicon::info() const {
    std::ostringstream out;
    out << size() << " words, " << fingerprint_count() << " fingerprints ("
        << unique_fingerprint_count() << " unique)";
    return out.str();
}

} // namespace cifra
