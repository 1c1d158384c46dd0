#include "cifra/escalation_json.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace cifra {

using json = nlohmann::json;

namespace {

std::string id_string(const json& node) {
    if (node.is_string()) {
        return node.get<std::string>();
    }
    if (node.is_number_integer()) {
        return std::to_string(node.get<long long>());
    }
    throw EscalationError("verdict id is neither a string nor an integer");
}

int table_number(const std::string& key) {
    std::size_t consumed = 0;
    int table_id = 0;
    try {
        table_id = std::stoi(key, &consumed);
    } catch (const std::logic_error&) {
        throw EscalationError("table key '" + key + "' is not a number");
    }
    if (consumed != key.size()) {
        throw EscalationError("table key '" + key + "' is not a number");
    }
    return table_id;
}

ExternalVerdict parse_verdict(const json& node, int table_id) {
    if (!node.is_object()) {
        throw EscalationError("verdict is not an object");
    }
    if (!node.contains("id")) {
        throw EscalationError("verdict without id");
    }
    ExternalVerdict verdict;
    verdict.table_id = table_id;
    verdict.field_id = id_string(node["id"]);

    auto value = node.find("valor");
    if (value != node.end() && !value->is_null()) {
        if (value->is_number_integer()) {
            verdict.value = static_cast<int>(std::clamp<long long>(value->get<long long>(), -1, 1000000));
        } else if (value->is_number_float() && std::floor(value->get<double>()) == value->get<double>()) {
            verdict.value = static_cast<int>(std::clamp(value->get<double>(), -1.0, 1000000.0));
        } else {
            throw EscalationError("verdict for field " + verdict.field_id + " has a non-integer value");
        }
    }

    auto rationale = node.find("razonamiento");
    if (rationale != node.end() && rationale->is_string()) {
        verdict.rationale = rationale->get<std::string>();
    }
    auto label = node.find("confianza");
    if (label != node.end() && label->is_string()) {
        verdict.label = parse_confidence_label(label->get<std::string>());
    }
    return verdict;
}

} // namespace

std::string escalation_request_json(const EscalationBatch& batch) {
    json tables = json::array();
    for (const auto& [table_id, candidates] : batch) {
        json fields = json::array();
        for (const auto& candidate : candidates) {
            fields.push_back({{"id", candidate.field_id}, {"contents", candidate.contents}});
        }
        tables.push_back({{"table_id", table_id}, {"fields", std::move(fields)}});
    }
    json request;
    request["tables"] = std::move(tables);
    // OCR text may carry stray bytes; they must not sink the whole batch
    return request.dump(-1, ' ', false, json::error_handler_t::replace);
}

EscalationResponse parse_escalation_response(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& ex) {
        throw EscalationError(std::string("escalation response is not JSON: ") + ex.what());
    }

    EscalationResponse response;
    if (doc.is_object() && doc.contains("resultados_por_tabla")) {
        const json& per_table = doc["resultados_por_tabla"];
        if (!per_table.is_object()) {
            throw EscalationError("'resultados_por_tabla' is not an object");
        }
        for (auto it = per_table.begin(); it != per_table.end(); ++it) {
            int table_id = table_number(it.key());
            if (!it.value().is_array()) {
                throw EscalationError("results of table " + it.key() + " are not a list");
            }
            auto& verdicts = response[table_id];
            for (const auto& node : it.value()) {
                verdicts.push_back(parse_verdict(node, table_id));
            }
        }
        return response;
    }

    if (doc.is_object() && doc.contains("resultados")) {
        const json& flat = doc["resultados"];
        if (!flat.is_array()) {
            throw EscalationError("'resultados' is not a list");
        }
        for (const auto& node : flat) {
            if (!node.is_object() || !node.contains("tabla") || !node["tabla"].is_number_integer()) {
                throw EscalationError("flat verdict without an integer 'tabla'");
            }
            const json& tabla = node["tabla"];
            bool fits = tabla.is_number_unsigned()
                ? tabla.get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<int>::max())
                : tabla.get<long long>() >= std::numeric_limits<int>::min() &&
                  tabla.get<long long>() <= std::numeric_limits<int>::max();
            if (!fits) {
                throw EscalationError("flat verdict 'tabla' " + tabla.dump() + " is out of range");
            }
            int table_id = tabla.get<int>();
            response[table_id].push_back(parse_verdict(node, table_id));
        }
        return response;
    }

    throw EscalationError("escalation response has neither 'resultados_por_tabla' nor 'resultados'");
}

EscalationResponse JsonBatchValidator::validate(const EscalationBatch& batch, const EscalationContext& context) {
    if (!transport_) {
        throw EscalationError("no escalation transport configured");
    }
    std::string request = escalation_request_json(batch);
    std::string answer = transport_(request, context);
    return parse_escalation_response(answer);
}

} // namespace cifra
