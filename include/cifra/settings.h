#pragma once

#include <string>
#include <unordered_map>

namespace cifra {

struct ResolverSettings {
    std::unordered_map<std::string, std::string> options;
    std::string profile;
    std::string input_file;
    std::string outfile;
    std::string settings_file;
    std::string lexicon_file;
    std::string escalation_response_file;
    std::string escalation_request_file;
    bool verbose = false;
    bool debug = false;
    bool strict = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    int get_int(const std::string& key, int fallback) const;
    double get_double(const std::string& key, double fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;
};

// --key=value and bare --flag arguments; anything else is ignored.
ResolverSettings parse_arguments(int argc, char** argv);

// Merges the selected profile of the XML settings file under the values
// already present in base. Throws std::runtime_error if the file cannot be
// read or has no matching profile.
ResolverSettings load_settings(const ResolverSettings& base);

} // namespace cifra
