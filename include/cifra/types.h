#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cifra {

// Values a field can take once resolved.
constexpr int kMinFieldValue = 0;
constexpr int kMaxFieldValue = 999;

inline bool in_field_range(long long value) {
    return value >= kMinFieldValue && value <= kMaxFieldValue;
}

// One field as read by the extraction step: every OCR token of the
// field's cells, in reading order.
struct RawFieldCandidate {
    std::string field_id;
    int table_id = 0;
    std::vector<std::string> contents;
};

// Letter form and digit form picked out of a candidate's contents.
struct Evidence {
    std::optional<std::string> letter_text;
    std::optional<std::string> digit_text;
};

enum class ResolutionMethod {
    ExactMatch,
    ExactPriority,
    FuzzyMatch,
    FuzzyPriority,
    NeedsEscalation,
    Unresolved,
    External
};

enum class ResolutionOrigin {
    Local,
    External
};

enum class ConfidenceLabel {
    Alta,
    Media,
    Baja,
    Unknown
};

struct ResolutionResult {
    std::string field_id;
    int table_id = 0;
    std::optional<int> value;
    double confidence = 0.0;
    ResolutionMethod method = ResolutionMethod::Unresolved;
    std::string rationale;
    ResolutionOrigin origin = ResolutionOrigin::Local;
    std::optional<ConfidenceLabel> confidence_label;  // only set for external answers

    bool operator==(const ResolutionResult& other) const {
        return field_id == other.field_id && table_id == other.table_id &&
               value == other.value && confidence == other.confidence &&
               method == other.method && rationale == other.rationale &&
               origin == other.origin && confidence_label == other.confidence_label;
    }
    bool operator!=(const ResolutionResult& other) const { return !(*this == other); }
};

// Fields handed to the external arbitration capability, per table, in
// their original order.
using EscalationBatch = std::map<int, std::vector<RawFieldCandidate>>;

// One answer of the external capability.
struct ExternalVerdict {
    std::string field_id;
    int table_id = 0;
    std::optional<int> value;
    ConfidenceLabel label = ConfidenceLabel::Unknown;
    std::string rationale;
};

using EscalationResponse = std::map<int, std::vector<ExternalVerdict>>;

const char* to_string(ResolutionMethod method);
const char* to_string(ResolutionOrigin origin);
const char* to_string(ConfidenceLabel label);

ConfidenceLabel parse_confidence_label(const std::string& label);

// Engine confidence assigned to an external answer.
double label_confidence(ConfidenceLabel label);

// True for methods that carry a locally derived value from the letter form.
bool is_local_decision(ResolutionMethod method);

} // namespace cifra
