// =============================================================================
// FILE: include/channel/webhook_parser.h
// =============================================================================
#ifndef CHANNEL_WEBHOOK_PARSER_H
#define CHANNEL_WEBHOOK_PARSER_H

#include "common/types.h"
#include "dispatch/inbound_message.h"
#include <map>
#include <string>
#include <vector>

namespace support_router {

// Decodes application/x-www-form-urlencoded ("a=1&b=x%20y+z")
std::map<std::string, std::string> parse_form_urlencoded(const std::string& body);

// Splits "path?query" and decodes the query part
std::map<std::string, std::string> parse_query_string(const std::string& target);

// Twilio form delivery. One message, or kInvalidArgument when From or the
// content is empty. Media without a body becomes "[Imagem]" / "[Áudio]" /
// "[Documento]".
Result parse_twilio_webhook(const std::string& form_body, InboundMessage& out);

// Meta Cloud API delivery. Appends every message with non-empty content.
// kInvalidArgument for malformed JSON; a payload for another object type
// parses to zero messages.
Result parse_meta_webhook(const std::string& json_body, std::vector<InboundMessage>& out);

// hub.mode == "subscribe" and hub.verify_token == expected
bool verify_webhook_subscription(const std::map<std::string, std::string>& query,
                                 const std::string& expected_token,
                                 std::string& challenge);

} // namespace support_router
#endif // CHANNEL_WEBHOOK_PARSER_H
