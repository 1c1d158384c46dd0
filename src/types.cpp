#include "cifra/types.h"

#include <algorithm>
#include <cctype>

namespace cifra {

const char* to_string(ResolutionMethod method) {
    switch (method) {
        case ResolutionMethod::ExactMatch:
            return "exact_match";
        case ResolutionMethod::ExactPriority:
            return "exact_priority";
        case ResolutionMethod::FuzzyMatch:
            return "fuzzy_match";
        case ResolutionMethod::FuzzyPriority:
            return "fuzzy_priority";
        case ResolutionMethod::NeedsEscalation:
            return "needs_escalation";
        case ResolutionMethod::Unresolved:
            return "unresolved";
        case ResolutionMethod::External:
            return "external";
    }
    return "unresolved";
}

const char* to_string(ResolutionOrigin origin) {
    switch (origin) {
        case ResolutionOrigin::Local:
            return "local";
        case ResolutionOrigin::External:
            return "external";
    }
    return "local";
}

const char* to_string(ConfidenceLabel label) {
    switch (label) {
        case ConfidenceLabel::Alta:
            return "alta";
        case ConfidenceLabel::Media:
            return "media";
        case ConfidenceLabel::Baja:
            return "baja";
        case ConfidenceLabel::Unknown:
            return "?";
    }
    return "?";
}

ConfidenceLabel parse_confidence_label(const std::string& label) {
    std::string lower = label;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "alta") {
        return ConfidenceLabel::Alta;
    }
    if (lower == "media") {
        return ConfidenceLabel::Media;
    }
    if (lower == "baja") {
        return ConfidenceLabel::Baja;
    }
    return ConfidenceLabel::Unknown;
}

double label_confidence(ConfidenceLabel label) {
    switch (label) {
        case ConfidenceLabel::Alta:
            return 0.90;
        case ConfidenceLabel::Media:
            return 0.60;
        case ConfidenceLabel::Baja:
            return 0.30;
        case ConfidenceLabel::Unknown:
            return 0.0;
    }
    return 0.0;
}

bool is_local_decision(ResolutionMethod method) {
    switch (method) {
        case ResolutionMethod::ExactMatch:
        case ResolutionMethod::ExactPriority:
        case ResolutionMethod::FuzzyMatch:
        case ResolutionMethod::FuzzyPriority:
            return true;
        case ResolutionMethod::NeedsEscalation:
        case ResolutionMethod::Unresolved:
        case ResolutionMethod::External:
            return false;
    }
    return false;
}

} // namespace cifra
