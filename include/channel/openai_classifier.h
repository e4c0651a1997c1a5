// =============================================================================
// FILE: include/channel/openai_classifier.h
// =============================================================================
#ifndef CHANNEL_OPENAI_CLASSIFIER_H
#define CHANNEL_OPENAI_CLASSIFIER_H

#include "channel/http_client.h"
#include "common/config.h"
#include "dispatch/classifier.h"
#include <atomic>

namespace support_router {

// Classifier backed by a chat-completions endpoint in JSON response mode.
// Transport and HTTP failures degrade to classifier_unavailable_result().
class OpenAiClassifier : public Classifier {
public:
    explicit OpenAiClassifier(const Config& config);

    ClassifierResult analyze(const std::string& message,
                             const std::vector<ContextEntry>& context,
                             const std::string& customer_name,
                             bool is_business_hours) override;

    // Request document sent for one analyze() call
    std::string build_request_body(const std::string& message,
                                   const std::vector<ContextEntry>& context,
                                   const std::string& customer_name,
                                   bool is_business_hours) const;

    // "Cliente: <name>\nMensagem do cliente: <text>[\n\n<out-of-hours notice>]"
    static std::string build_user_prompt(const std::string& message,
                                         const std::string& customer_name,
                                         bool is_business_hours);

    const std::string& system_prompt() const { return system_prompt_; }

    struct ClassifierStats {
        std::atomic<uint64_t> requests{0};
        std::atomic<uint64_t> failures{0};
    };
    const ClassifierStats& stats() const { return stats_; }

private:
    static std::string load_prompt(const std::string& path);

    std::string endpoint_;
    std::string api_key_;
    std::string model_;
    double temperature_;
    int max_tokens_;
    std::string system_prompt_;
    HttpClient http_;
    ClassifierStats stats_;
};

} // namespace support_router
#endif // CHANNEL_OPENAI_CLASSIFIER_H
