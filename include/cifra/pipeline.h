#pragma once

#include "arbitrator.h"
#include "escalation.h"
#include "lexicon.h"
#include "settings.h"
#include "types.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cifra {

enum class EscalationStatus {
    NotNeeded,    // every field was accepted locally
    Completed,    // the external answer was merged
    Failed,       // the collaborator threw or answered garbage
    Cancelled,    // the caller gave up before the answer was used
    Unavailable   // nothing to escalate to
};

const char* to_string(EscalationStatus status);

struct PipelineOptions {
    double acceptance_threshold = 0.75;
    std::chrono::milliseconds escalation_timeout{30000};
    ArbitrationPolicy policy;
    bool verbose = false;
    bool debug = false;
};

struct PipelineStats {
    int field_count = 0;
    int accepted_locally = 0;
    int escalated = 0;
    int resolved_externally = 0;
    int unresolved = 0;
    float local_seconds = 0.f;
    float escalation_seconds = 0.f;
};

struct DocumentResolution {
    std::vector<ResolutionResult> results;  // by table id, then original field order
    EscalationStatus escalation = EscalationStatus::NotNeeded;
    std::string escalation_error;
    PipelineStats stats;

    bool partial() const {
        return escalation == EscalationStatus::Failed ||
               escalation == EscalationStatus::Cancelled ||
               escalation == EscalationStatus::Unavailable;
    }
};

// Gathers the fields that need the external capability so the document
// makes one call, not one per field.
class EscalationCollector {
public:
    void add(const RawFieldCandidate& candidate);

    bool empty() const { return count_ == 0; }
    std::size_t size() const { return count_; }

    // Hands over the batch and starts a new one.
    EscalationBatch flush();

private:
    EscalationBatch batch_;
    std::size_t count_ = 0;
};

class ResolutionPipeline {
public:
    // nullptr uses the built-in Spanish lexicon.
    explicit ResolutionPipeline(std::shared_ptr<const Lexicon> lexicon = nullptr);

    void configure(const ResolverSettings& settings);
    void set_options(const PipelineOptions& options);
    const PipelineOptions& options() const { return options_; }

    // Provisional local decision for one field.
    ResolutionResult resolve_field(const RawFieldCandidate& candidate) const;

    bool locally_accepted(const ResolutionResult& result) const;

    // validator may be nullptr; escalated fields then stay unresolved.
    DocumentResolution resolve_document(const std::vector<RawFieldCandidate>& candidates,
                                        BatchValidator* validator,
                                        const CancellationToken& cancellation = CancellationToken()) const;

private:
    std::shared_ptr<const Lexicon> lexicon_;
    PipelineOptions options_;
    std::unique_ptr<FieldArbitrator> arbitrator_;
};

} // namespace cifra
