// =============================================================================
// FILE: src/channel/twilio_sender.cpp
// =============================================================================
#include "channel/twilio_sender.h"
#include "channel/address.h"
#include "common/logger.h"
#include <json/json.h>
#include <sstream>

namespace support_router {

TwilioSender::TwilioSender(const Config& config)
    : api_base_(config.sender_api_base)
    , account_sid_(config.sender_account_sid)
    , auth_token_(config.sender_auth_token)
    , from_number_(config.sender_from_number)
    , normalize_br_mobile_(config.sender_normalize_br_mobile)
    , http_(config.sender_timeout)
{
    while (!api_base_.empty() && api_base_.back() == '/') api_base_.pop_back();
    http_.set_basic_auth(account_sid_, auth_token_);
    if (!configured()) {
        LOG_WARN("TwilioSender: credentials not configured, every send will fail");
    }
}

std::string TwilioSender::messages_url() const {
    return api_base_ + "/Accounts/" + account_sid_ + "/Messages.json";
}

std::string TwilioSender::destination_for(const std::string& address) const {
    std::string digits = normalize_address(address);
    if (normalize_br_mobile_) digits = to_br_mobile(digits);
    return "whatsapp:+" + digits;
}

SendResult TwilioSender::send(const std::string& address, const std::string& text) {
    SendResult result;
    if (!configured()) {
        result.error = "sender not configured";
        stats_.failed.fetch_add(1, std::memory_order_relaxed);
        return result;
    }

    std::map<std::string, std::string> form;
    form["To"]   = destination_for(address);
    form["From"] = "whatsapp:" + from_number_;
    form["Body"] = text;

    HttpResponse resp = http_.post_form(messages_url(), form);

    Json::Value body;
    if (!resp.body.empty()) {
        Json::CharReaderBuilder builder;
        std::string errs;
        std::istringstream in(resp.body);
        if (!Json::parseFromStream(builder, in, &body, &errs)) body = Json::Value();
    }

    if (!resp.ok()) {
        result.error = resp.error;
        if (body.isObject() && body.isMember("message")) {
            result.error = std::to_string(body.get("code", 0).asInt()) + " - " +
                           body["message"].asString();
        }
        stats_.failed.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("TwilioSender: send to %s failed: %s", address.c_str(), result.error.c_str());
        return result;
    }

    result.success = true;
    if (body.isObject()) {
        result.message_id = body.get("sid", "").asString();
        result.status = body.get("status", "").asString();
    }
    stats_.sent.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("TwilioSender: message %s sent to %s (%s)",
             result.message_id.c_str(), address.c_str(), result.status.c_str());
    return result;
}

} // namespace support_router
