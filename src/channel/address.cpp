// =============================================================================
// FILE: src/channel/address.cpp
// =============================================================================
#include "channel/address.h"
#include <cctype>

namespace support_router {

std::string normalize_address(const std::string& raw) {
    static const std::string kPrefix = "whatsapp:";
    size_t start = (raw.compare(0, kPrefix.size(), kPrefix) == 0) ? kPrefix.size() : 0;

    std::string out;
    out.reserve(raw.size());
    for (size_t i = start; i < raw.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(raw[i]))) out += raw[i];
    }
    return out;
}

std::string to_br_mobile(const std::string& address) {
    if (address.size() != 12 || address.compare(0, 2, "55") != 0) return address;
    return address.substr(0, 4) + "9" + address.substr(4);
}

} // namespace support_router
