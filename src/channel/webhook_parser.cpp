// =============================================================================
// FILE: src/channel/webhook_parser.cpp
// =============================================================================
#include "channel/webhook_parser.h"
#include "channel/address.h"
#include "common/logger.h"
#include <json/json.h>
#include <sstream>

namespace support_router {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out += s[i];
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

std::string media_placeholder(const std::string& content_type) {
    if (content_type.compare(0, 6, "image/") == 0) return "[Imagem]";
    if (content_type.compare(0, 6, "audio/") == 0) return "[Áudio]";
    return "[Documento]";
}

MessageKind kind_from_content_type(const std::string& content_type) {
    if (content_type.compare(0, 6, "image/") == 0) return MessageKind::kImage;
    if (content_type.compare(0, 6, "audio/") == 0) return MessageKind::kAudio;
    if (content_type.empty()) return MessageKind::kOther;
    return MessageKind::kDocument;
}

std::string get_or_empty(const std::map<std::string, std::string>& m, const char* key) {
    auto it = m.find(key);
    return it != m.end() ? it->second : std::string();
}

} // namespace

std::map<std::string, std::string> parse_form_urlencoded(const std::string& body) {
    std::map<std::string, std::string> out;
    std::istringstream stream(body);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            out[url_decode(pair)] = "";
        } else {
            out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query_string(const std::string& target) {
    auto q = target.find('?');
    if (q == std::string::npos) return {};
    return parse_form_urlencoded(target.substr(q + 1));
}

Result parse_twilio_webhook(const std::string& form_body, InboundMessage& out) {
    auto form = parse_form_urlencoded(form_body);

    InboundMessage msg;
    msg.address = normalize_address(get_or_empty(form, "From"));
    msg.text = get_or_empty(form, "Body");
    msg.channel_message_id = get_or_empty(form, "MessageSid");
    msg.sender_name = get_or_empty(form, "ProfileName");

    int num_media = 0;
    try {
        std::string n = get_or_empty(form, "NumMedia");
        if (!n.empty()) num_media = std::stoi(n);
    } catch (const std::exception&) {
        LOG_WARN("Twilio webhook: bad NumMedia '%s'", get_or_empty(form, "NumMedia").c_str());
    }
    if (num_media > 0) {
        std::string content_type = get_or_empty(form, "MediaContentType0");
        msg.media_url = get_or_empty(form, "MediaUrl0");
        msg.kind = kind_from_content_type(content_type);
        if (msg.text.empty()) msg.text = media_placeholder(content_type);
    }

    if (msg.address.empty() || msg.text.empty()) {
        LOG_DEBUG("Twilio webhook: ignoring delivery without sender or content (sid=%s)",
                  msg.channel_message_id.c_str());
        return Result::kInvalidArgument;
    }
    out = std::move(msg);
    return Result::kOk;
}

Result parse_meta_webhook(const std::string& json_body, std::vector<InboundMessage>& out) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream in(json_body);
    if (!Json::parseFromStream(builder, in, &root, &errs) || !root.isObject()) {
        LOG_WARN("Meta webhook: unparseable payload: %s", errs.c_str());
        return Result::kInvalidArgument;
    }
    if (root.get("object", "").asString() != "whatsapp_business_account") {
        return Result::kOk;
    }

    for (const auto& entry : root["entry"]) {
        for (const auto& change : entry["changes"]) {
            if (change.get("field", "").asString() != "messages") continue;
            const Json::Value& value = change["value"];

            std::string contact_name;
            const Json::Value& contacts = value["contacts"];
            if (contacts.isArray() && !contacts.empty()) {
                contact_name = contacts[0u]["profile"].get("name", "").asString();
            }

            for (const auto& m : value["messages"]) {
                InboundMessage msg;
                msg.address = normalize_address(m.get("from", "").asString());
                msg.channel_message_id = m.get("id", "").asString();
                msg.sender_name = contact_name;

                std::string type = m.get("type", "text").asString();
                msg.kind = parse_message_kind(type);
                if (type == "text") {
                    msg.text = m["text"].get("body", "").asString();
                } else if (type == "image") {
                    msg.text = m["image"].get("caption", "[Imagem]").asString();
                } else if (type == "audio") {
                    msg.text = "[Áudio]";
                } else {
                    msg.text = "[" + type + "]";
                }

                if (msg.text.empty() || msg.address.empty()) {
                    LOG_WARN("Meta webhook: empty content for message %s",
                             msg.channel_message_id.c_str());
                    continue;
                }
                out.push_back(std::move(msg));
            }
        }
    }
    return Result::kOk;
}

bool verify_webhook_subscription(const std::map<std::string, std::string>& query,
                                 const std::string& expected_token,
                                 std::string& challenge) {
    if (get_or_empty(query, "hub.mode") != "subscribe") return false;
    if (expected_token.empty() || get_or_empty(query, "hub.verify_token") != expected_token) {
        return false;
    }
    challenge = get_or_empty(query, "hub.challenge");
    return true;
}

} // namespace support_router
