// =============================================================================
// FILE: include/dispatch/sender.h
// =============================================================================
#ifndef DISPATCH_SENDER_H
#define DISPATCH_SENDER_H

#include <string>

namespace support_router {

struct SendResult {
    bool        success = false;
    std::string message_id;   // channel id of the sent message
    std::string status;
    std::string error;
};

// Outbound text delivery to a customer address. Failures are reported in
// the result, not thrown.
class Sender {
public:
    virtual ~Sender() = default;
    virtual SendResult send(const std::string& address, const std::string& text) = 0;
};

} // namespace support_router
#endif // DISPATCH_SENDER_H
