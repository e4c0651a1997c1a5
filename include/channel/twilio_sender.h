// =============================================================================
// FILE: include/channel/twilio_sender.h
// =============================================================================
#ifndef CHANNEL_TWILIO_SENDER_H
#define CHANNEL_TWILIO_SENDER_H

#include "channel/http_client.h"
#include "common/config.h"
#include "dispatch/sender.h"
#include <atomic>

namespace support_router {

// WhatsApp delivery through the Twilio Messages API:
//   POST {api_base}/Accounts/{sid}/Messages.json
//   To=whatsapp:+<address>  From=whatsapp:<from_number>  Body=<text>
class TwilioSender : public Sender {
public:
    explicit TwilioSender(const Config& config);

    SendResult send(const std::string& address, const std::string& text) override;

    bool configured() const { return !account_sid_.empty() && !auth_token_.empty(); }

    // Exposed for tests
    std::string messages_url() const;
    std::string destination_for(const std::string& address) const;

    struct SenderStats {
        std::atomic<uint64_t> sent{0};
        std::atomic<uint64_t> failed{0};
    };
    const SenderStats& stats() const { return stats_; }

private:
    std::string api_base_;
    std::string account_sid_;
    std::string auth_token_;
    std::string from_number_;
    bool normalize_br_mobile_;
    HttpClient http_;
    SenderStats stats_;
};

} // namespace support_router
#endif // CHANNEL_TWILIO_SENDER_H
