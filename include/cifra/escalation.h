#pragma once

#include "types.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace cifra {

// Shared flag the caller raises to abandon a pending escalation. Copies
// observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct EscalationContext {
    std::chrono::milliseconds timeout{30000};
    CancellationToken cancellation;
};

// Raised by collaborators when the external capability cannot be reached or
// answers with something that is not a verdict list.
class EscalationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// External arbitration capability. Receives every field the engine could not
// settle for one document in a single call and answers per table. Retries,
// if any, belong to the implementation.
class BatchValidator {
public:
    virtual ~BatchValidator() = default;

    virtual EscalationResponse validate(const EscalationBatch& batch, const EscalationContext& context) = 0;
};

} // namespace cifra
