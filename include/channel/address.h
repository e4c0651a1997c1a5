// =============================================================================
// FILE: include/channel/address.h
// =============================================================================
#ifndef CHANNEL_ADDRESS_H
#define CHANNEL_ADDRESS_H

#include <string>

namespace support_router {

// "whatsapp:+55 (53) 9999-0000" -> "5553999990000"
std::string normalize_address(const std::string& raw);

// 12-digit "55" + DDD + 8-digit numbers get the mobile "9" inserted after
// the DDD. Anything else is returned unchanged.
std::string to_br_mobile(const std::string& address);

} // namespace support_router
#endif // CHANNEL_ADDRESS_H
