#include "cifra/exporter.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

namespace cifra {

namespace {

// Results arrive grouped by table; a new header starts at each change.
template <typename Header, typename Line>
std::string by_table(const std::vector<ResolutionResult>& results, Header header, Line line) {
    std::ostringstream out;
    bool first = true;
    int current = 0;
    for (const auto& result : results) {
        if (first || result.table_id != current) {
            if (!first) {
                out << "\n";
            }
            header(out, result.table_id);
            current = result.table_id;
            first = false;
        }
        line(out, result);
    }
    return out.str();
}

} // namespace

std::string render_toon(const std::vector<ResolutionResult>& results) {
    std::vector<ResolutionResult> with_value;
    for (const auto& result : results) {
        if (result.value && !result.field_id.empty()) {
            with_value.push_back(result);
        }
    }
    return by_table(
        with_value,
        [](std::ostringstream& out, int table_id) { out << "--- TABLE " << table_id << " ---\n"; },
        [](std::ostringstream& out, const ResolutionResult& result) {
            out << result.field_id << " : " << *result.value << "\n";
        });
}

std::string render_report(const std::vector<ResolutionResult>& results) {
    return by_table(
        results,
        [](std::ostringstream& out, int table_id) {
            out << std::string(50, '=') << "\n TABLE " << table_id << "\n" << std::string(50, '=') << "\n";
        },
        [](std::ostringstream& out, const ResolutionResult& result) {
            out << "  " << std::left << std::setw(4) << result.field_id << " ";
            if (result.value) {
                out << *result.value;
            } else {
                out << "NULL";
            }
            out << "  [" << to_string(result.method) << ", " << to_string(result.origin) << ", "
                << std::fixed << std::setprecision(2) << result.confidence;
            if (result.confidence_label) {
                out << ", " << to_string(*result.confidence_label);
            }
            out << "]\n";
            if (!result.rationale.empty()) {
                out << "       " << result.rationale << "\n";
            }
        });
}

std::string results_to_json(const DocumentResolution& resolution) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : resolution.results) {
        nlohmann::json item = {
            {"field_id", result.field_id},
            {"table_id", result.table_id},
            {"confidence", result.confidence},
            {"method", to_string(result.method)},
            {"origin", to_string(result.origin)},
            {"rationale", result.rationale},
        };
        item["value"] = result.value ? nlohmann::json(*result.value) : nlohmann::json(nullptr);
        if (result.confidence_label) {
            item["confidence_label"] = to_string(*result.confidence_label);
        }
        results.push_back(std::move(item));
    }

    nlohmann::json doc;
    doc["results"] = std::move(results);
    doc["escalation"] = to_string(resolution.escalation);
    doc["partial"] = resolution.partial();
    if (!resolution.escalation_error.empty()) {
        doc["escalation_error"] = resolution.escalation_error;
    }
    const PipelineStats& stats = resolution.stats;
    doc["stats"] = {
        {"fields", stats.field_count},
        {"accepted_locally", stats.accepted_locally},
        {"escalated", stats.escalated},
        {"resolved_externally", stats.resolved_externally},
        {"unresolved", stats.unresolved},
    };
    return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace cifra
