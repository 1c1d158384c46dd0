#pragma once

#include "exact_resolver.h"
#include "fuzzy_resolver.h"
#include "lexicon.h"
#include "types.h"

#include <optional>
#include <string>

namespace cifra {

struct ArbitrationPolicy {
    double fuzzy_min_confidence = 0.60;  // below this a fuzzy reading is not used
    double fuzzy_match_cap = 0.95;       // fuzzy reading confirmed by the digits
    double fuzzy_priority_cap = 0.85;    // fuzzy reading against or without digits
};

// Decides one field from its letter form and digit form. The letter form
// always outranks the digits; the digits only confirm.
class FieldArbitrator {
public:
    explicit FieldArbitrator(const Lexicon& lexicon, ArbitrationPolicy policy = ArbitrationPolicy());

    // field_id/table_id of the result are left for the caller.
    ResolutionResult arbitrate(const std::optional<std::string>& letter_text,
                               const std::optional<std::string>& digit_text) const;

    ResolutionResult arbitrate(const Evidence& evidence) const {
        return arbitrate(evidence.letter_text, evidence.digit_text);
    }

    // "035" -> 35, "5 0" -> 50, "" or "abc" -> nullopt.
    static std::optional<int> parse_digits(const std::string& text);

private:
    ExactResolver exact_;
    FuzzyResolver fuzzy_;
    ArbitrationPolicy policy_;

    std::string fingerprint_hints(const std::string& letter_text) const;
};

} // namespace cifra
