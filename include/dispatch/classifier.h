// =============================================================================
// FILE: include/dispatch/classifier.h
// =============================================================================
#ifndef DISPATCH_CLASSIFIER_H
#define DISPATCH_CLASSIFIER_H

#include "state/context_store.h"
#include <string>
#include <vector>

namespace support_router {

struct ClassifierResult {
    std::string intent = "outros";
    bool        needs_human = false;
    std::string response;
    double      confidence = 0.5;
};

// Natural-language intent detection plus reply generation.
// Implementations handle their own transport failures and timeouts and
// return a degraded result instead of throwing.
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual ClassifierResult analyze(const std::string& message,
                                     const std::vector<ContextEntry>& context,
                                     const std::string& customer_name,
                                     bool is_business_hours) = 0;
};

// Reply texts used when the classifier output is missing or unusable
extern const char* const kMissingResponseText;
extern const char* const kUnparseableResponseText;
extern const char* const kUnavailableResponseText;

// Applies the defaulting rules to a JSON reply body:
//   intent      missing -> "outros"
//   needs_human missing -> false
//   response    missing -> kMissingResponseText and needs_human = true
//   confidence  missing -> 0.5
// Unparseable (or non-object) content gives
//   {"outros", needs_human = true, kUnparseableResponseText, 0.0}
ClassifierResult parse_classifier_reply(const std::string& content);

// Result for a classifier that could not be reached at all
ClassifierResult classifier_unavailable_result();

} // namespace support_router
#endif // DISPATCH_CLASSIFIER_H
