#pragma once

#include "escalation.h"
#include "types.h"

#include <functional>
#include <string>

namespace cifra {

// {"tables":[{"table_id":1,"fields":[{"id":"94","contents":["veinisinco","25"]}]}]}
std::string escalation_request_json(const EscalationBatch& batch);

// Accepts {"resultados_por_tabla":{"1":[{"id":"94","valor":25,"razonamiento":"...","confianza":"alta"}]}}
// or {"resultados":[{"tabla":1,"id":"94",...}]}. Throws EscalationError if
// the text is not JSON or does not have either shape.
EscalationResponse parse_escalation_response(const std::string& json_text);

// BatchValidator speaking JSON over a caller supplied transport (an HTTP
// client, a message queue, a recorded answer on disk).
class JsonBatchValidator : public BatchValidator {
public:
    using Transport = std::function<std::string(const std::string& request_json, const EscalationContext& context)>;

    explicit JsonBatchValidator(Transport transport) : transport_(std::move(transport)) {}

    EscalationResponse validate(const EscalationBatch& batch, const EscalationContext& context) override;

private:
    Transport transport_;
};

} // namespace cifra
