#pragma once

#include "types.h"

#include "rapidjson/document.h"

#include <string>
#include <vector>

namespace cifra {

// Reads the extraction step's output:
// {"tables":[{"id":1,"fields":[{"id":"94","contents":["veinisinco","25"]}]}]}
class CandidateLoader {
public:
    bool load(const std::string& path, std::vector<RawFieldCandidate>& candidates);
    bool parse(const std::string& content, std::vector<RawFieldCandidate>& candidates);

private:
    bool parse_table(const rapidjson::Value& table_obj, std::vector<RawFieldCandidate>& candidates);
    bool parse_field(const rapidjson::Value& field_obj, int table_id, RawFieldCandidate& candidate);
};

} // namespace cifra
