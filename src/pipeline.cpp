#include "cifra/pipeline.h"
#include "cifra/evidence.h"

#include <iostream>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace cifra {

namespace {

float seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
}

ResolutionResult external_result(const ExternalVerdict& verdict) {
    ResolutionResult result;
    result.field_id = verdict.field_id;
    result.table_id = verdict.table_id;
    result.origin = ResolutionOrigin::External;
    result.confidence_label = verdict.label;
    result.rationale = verdict.rationale;

    if (verdict.value && !in_field_range(*verdict.value)) {
        result.method = ResolutionMethod::Unresolved;
        result.confidence = 0.0;
        result.rationale = "External value " + std::to_string(*verdict.value) +
                           " outside 0-999. " + verdict.rationale;
        return result;
    }
    result.method = ResolutionMethod::External;
    result.value = verdict.value;
    result.confidence = verdict.value ? label_confidence(verdict.label) : 0.0;
    return result;
}

ResolutionResult placeholder(const ResolutionResult& provisional, EscalationStatus status,
                             const std::string& error) {
    ResolutionResult result;
    result.field_id = provisional.field_id;
    result.table_id = provisional.table_id;
    result.method = ResolutionMethod::Unresolved;
    result.origin = ResolutionOrigin::Local;
    result.confidence = 0.0;
    result.rationale = provisional.rationale;
    switch (status) {
        case EscalationStatus::Completed:
            result.rationale += " No external answer for this field.";
            break;
        case EscalationStatus::Failed:
            result.rationale += " Escalation failed: " + error;
            break;
        case EscalationStatus::Cancelled:
            result.rationale += " Escalation cancelled.";
            break;
        case EscalationStatus::Unavailable:
        case EscalationStatus::NotNeeded:
            result.rationale += " No escalation available.";
            break;
    }
    return result;
}

} // namespace

const char* to_string(EscalationStatus status) {
    switch (status) {
        case EscalationStatus::NotNeeded:
            return "not_needed";
        case EscalationStatus::Completed:
            return "completed";
        case EscalationStatus::Failed:
            return "failed";
        case EscalationStatus::Cancelled:
            return "cancelled";
        case EscalationStatus::Unavailable:
            return "unavailable";
    }
    return "unavailable";
}

void EscalationCollector::add(const RawFieldCandidate& candidate) {
    batch_[candidate.table_id].push_back(candidate);
    ++count_;
}

EscalationBatch EscalationCollector::flush() {
    EscalationBatch batch = std::move(batch_);
    batch_.clear();
    count_ = 0;
    return batch;
}

ResolutionPipeline::ResolutionPipeline(std::shared_ptr<const Lexicon> lexicon)
    : lexicon_(std::move(lexicon)) {
    if (!lexicon_) {
        // Non-owning: the built-in lexicon lives for the whole process
        lexicon_ = std::shared_ptr<const Lexicon>(std::shared_ptr<const Lexicon>(), &Lexicon::spanish());
    }
    arbitrator_ = std::make_unique<FieldArbitrator>(*lexicon_, options_.policy);
}

void ResolutionPipeline::configure(const ResolverSettings& settings) {
    PipelineOptions options;
    options.acceptance_threshold = settings.get_double("acceptance_threshold", options.acceptance_threshold);
    options.escalation_timeout = std::chrono::milliseconds(
        settings.get_int("escalation_timeout_ms", static_cast<int>(options.escalation_timeout.count())));
    options.policy.fuzzy_min_confidence = settings.get_double("fuzzy_min_confidence", options.policy.fuzzy_min_confidence);
    options.policy.fuzzy_match_cap = settings.get_double("fuzzy_match_cap", options.policy.fuzzy_match_cap);
    options.policy.fuzzy_priority_cap = settings.get_double("fuzzy_priority_cap", options.policy.fuzzy_priority_cap);
    options.verbose = settings.verbose;
    options.debug = settings.debug;
    set_options(options);
}

void ResolutionPipeline::set_options(const PipelineOptions& options) {
    options_ = options;
    arbitrator_ = std::make_unique<FieldArbitrator>(*lexicon_, options_.policy);
}

ResolutionResult ResolutionPipeline::resolve_field(const RawFieldCandidate& candidate) const {
    ResolutionResult result = arbitrator_->arbitrate(EvidenceClassifier::classify(candidate.contents));
    result.field_id = candidate.field_id;
    result.table_id = candidate.table_id;
    result.origin = ResolutionOrigin::Local;
    return result;
}

bool ResolutionPipeline::locally_accepted(const ResolutionResult& result) const {
    return is_local_decision(result.method) && result.confidence >= options_.acceptance_threshold;
}

DocumentResolution ResolutionPipeline::resolve_document(const std::vector<RawFieldCandidate>& candidates,
                                                        BatchValidator* validator,
                                                        const CancellationToken& cancellation) const {
    DocumentResolution resolution;
    PipelineStats& stats = resolution.stats;
    auto local_start = std::chrono::steady_clock::now();

    std::vector<ResolutionResult> provisional;
    std::vector<bool> accepted;
    provisional.reserve(candidates.size());
    accepted.reserve(candidates.size());
    std::map<int, std::vector<std::size_t>> table_order;
    EscalationCollector collector;

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const RawFieldCandidate& candidate = candidates[i];
        provisional.push_back(resolve_field(candidate));
        table_order[candidate.table_id].push_back(i);

        const ResolutionResult& result = provisional.back();
        bool keep = locally_accepted(result);
        accepted.push_back(keep);
        if (keep) {
            ++stats.accepted_locally;
        } else {
            collector.add(candidate);
        }
        if (options_.debug) {
            std::cerr << "[cifra] table " << candidate.table_id << " field " << candidate.field_id
                      << ": " << to_string(result.method) << " value="
                      << (result.value ? std::to_string(*result.value) : "null")
                      << " confidence=" << result.confidence
                      << (keep ? " (accepted)" : " (escalate)") << "\n";
        }
    }
    stats.field_count = static_cast<int>(candidates.size());
    stats.escalated = static_cast<int>(collector.size());
    stats.local_seconds = seconds_since(local_start);

    EscalationResponse response;
    if (collector.empty()) {
        resolution.escalation = EscalationStatus::NotNeeded;
    } else if (validator == nullptr) {
        resolution.escalation = EscalationStatus::Unavailable;
    } else if (cancellation.cancelled()) {
        resolution.escalation = EscalationStatus::Cancelled;
    } else {
        EscalationBatch batch = collector.flush();
        if (options_.debug) {
            for (const auto& [table_id, fields] : batch) {
                std::cerr << "[cifra] escalating table " << table_id << ":";
                for (const auto& field : fields) {
                    std::cerr << " " << field.field_id;
                }
                std::cerr << "\n";
            }
        }
        EscalationContext context;
        context.timeout = options_.escalation_timeout;
        context.cancellation = cancellation;

        auto escalation_start = std::chrono::steady_clock::now();
        try {
            response = validator->validate(batch, context);
            resolution.escalation = EscalationStatus::Completed;
        } catch (const std::exception& ex) {
            resolution.escalation = EscalationStatus::Failed;
            resolution.escalation_error = ex.what();
            response.clear();
        } catch (...) {
            resolution.escalation = EscalationStatus::Failed;
            resolution.escalation_error = "unknown error from the escalation collaborator";
            response.clear();
        }
        if (resolution.escalation == EscalationStatus::Completed && cancellation.cancelled()) {
            resolution.escalation = EscalationStatus::Cancelled;
            response.clear();
        }
        stats.escalation_seconds = seconds_since(escalation_start);
    }

    if (resolution.escalation == EscalationStatus::Failed) {
        std::cerr << "[cifra] Warning: escalation of " << stats.escalated << " fields failed: "
                  << resolution.escalation_error << std::endl;
    } else if (options_.verbose && resolution.escalation != EscalationStatus::NotNeeded) {
        std::cerr << "[cifra] escalation of " << stats.escalated << " fields: "
                  << to_string(resolution.escalation) << "\n";
    }

    std::set<int> tables;
    for (const auto& [table_id, positions] : table_order) {
        tables.insert(table_id);
    }
    for (const auto& [table_id, verdicts] : response) {
        tables.insert(table_id);
    }

    for (int table_id : tables) {
        std::unordered_map<std::string, const ExternalVerdict*> verdict_by_field;
        auto answered = response.find(table_id);
        if (answered != response.end()) {
            for (const auto& verdict : answered->second) {
                verdict_by_field.emplace(verdict.field_id, &verdict);
            }
        }

        std::unordered_set<std::string> seen;
        auto ordered = table_order.find(table_id);
        if (ordered != table_order.end()) {
            for (std::size_t position : ordered->second) {
                const ResolutionResult& local = provisional[position];
                seen.insert(local.field_id);
                if (accepted[position]) {
                    resolution.results.push_back(local);
                    continue;
                }
                auto verdict = verdict_by_field.find(local.field_id);
                if (verdict != verdict_by_field.end()) {
                    resolution.results.push_back(external_result(*verdict->second));
                } else {
                    resolution.results.push_back(placeholder(local, resolution.escalation, resolution.escalation_error));
                }
            }
        }

        // Answers for fields the extraction step did not list
        if (answered != response.end()) {
            for (const auto& verdict : answered->second) {
                if (seen.insert(verdict.field_id).second) {
                    resolution.results.push_back(external_result(verdict));
                }
            }
        }
    }

    for (const auto& result : resolution.results) {
        if (!result.value) {
            ++stats.unresolved;
        } else if (result.origin == ResolutionOrigin::External) {
            ++stats.resolved_externally;
        }
    }

    if (options_.verbose) {
        std::cerr << "[cifra] " << stats.field_count << " fields: " << stats.accepted_locally
                  << " accepted locally, " << stats.escalated << " escalated, "
                  << stats.resolved_externally << " resolved externally, "
                  << stats.unresolved << " without value (local " << stats.local_seconds
                  << "s, escalation " << stats.escalation_seconds << "s)\n";
    }
    return resolution;
}

} // namespace cifra
