#include "cifra/candidate_loader.h"

#include "rapidjson/error/en.h"

#include <fstream>
#include <iostream>
#include <iterator>

namespace cifra {

using namespace rapidjson;

bool CandidateLoader::load(const std::string& path, std::vector<RawFieldCandidate>& candidates) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[cifra] Error: Cannot open input file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return parse(content, candidates);
}

bool CandidateLoader::parse(const std::string& content, std::vector<RawFieldCandidate>& candidates) {
    Document doc;
    // Invalid UTF-8 is rejected here, not when the fields are written out again
    doc.Parse<kParseValidateEncodingFlag>(content.c_str());

    if (doc.HasParseError()) {
        std::cerr << "[cifra] Error: JSON parse error at position " << doc.GetErrorOffset()
                  << ": " << GetParseError_En(doc.GetParseError()) << std::endl;
        return false;
    }

    if (!doc.IsObject() || !doc.HasMember("tables") || !doc["tables"].IsArray()) {
        std::cerr << "[cifra] Error: Missing or invalid 'tables' field" << std::endl;
        return false;
    }

    std::vector<RawFieldCandidate> parsed;
    for (const auto& table : doc["tables"].GetArray()) {
        if (!parse_table(table, parsed)) {
            return false;
        }
    }
    candidates.insert(candidates.end(),
                      std::make_move_iterator(parsed.begin()),
                      std::make_move_iterator(parsed.end()));
    return true;
}

bool CandidateLoader::parse_table(const Value& table_obj, std::vector<RawFieldCandidate>& candidates) {
    if (!table_obj.IsObject() || !table_obj.HasMember("id") || !table_obj["id"].IsInt()) {
        std::cerr << "[cifra] Error: table without an integer 'id'" << std::endl;
        return false;
    }
    int table_id = table_obj["id"].GetInt();

    if (!table_obj.HasMember("fields") || !table_obj["fields"].IsArray()) {
        std::cerr << "[cifra] Warning: table " << table_id << " has no fields" << std::endl;
        return true;
    }

    for (const auto& field : table_obj["fields"].GetArray()) {
        RawFieldCandidate candidate;
        if (parse_field(field, table_id, candidate)) {
            candidates.push_back(std::move(candidate));
        } else {
            std::cerr << "[cifra] Warning: skipping malformed field in table " << table_id << std::endl;
        }
    }
    return true;
}

bool CandidateLoader::parse_field(const Value& field_obj, int table_id, RawFieldCandidate& candidate) {
    if (!field_obj.IsObject() || !field_obj.HasMember("id")) {
        return false;
    }
    const Value& id = field_obj["id"];
    if (id.IsString()) {
        candidate.field_id = id.GetString();
    } else if (id.IsInt()) {
        candidate.field_id = std::to_string(id.GetInt());
    } else {
        return false;
    }
    candidate.table_id = table_id;

    if (field_obj.HasMember("contents") && field_obj["contents"].IsArray()) {
        for (const auto& token : field_obj["contents"].GetArray()) {
            if (token.IsString()) {
                candidate.contents.emplace_back(token.GetString(), token.GetStringLength());
            }
        }
    }
    return true;
}

} // namespace cifra
