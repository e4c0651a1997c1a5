// =============================================================================
// FILE: src/dispatch/classifier.cpp
// =============================================================================
#include "dispatch/classifier.h"
#include "common/logger.h"
#include <json/json.h>
#include <memory>

namespace support_router {

const char* const kMissingResponseText =
    "Desculpe, não consegui processar sua mensagem. Um atendente irá ajudá-lo em breve.";
const char* const kUnparseableResponseText =
    "Desculpe, tive um problema ao processar sua mensagem. Um atendente irá ajudá-lo em breve.";
const char* const kUnavailableResponseText =
    "Desculpe, estou com dificuldades técnicas. Um atendente irá ajudá-lo em breve.";

ClassifierResult parse_classifier_reply(const std::string& content) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;

    if (!reader->parse(content.data(), content.data() + content.size(), &root, &errs) ||
        !root.isObject()) {
        LOG_ERROR("Classifier reply is not a JSON object: %s", errs.c_str());
        ClassifierResult failed;
        failed.intent = "outros";
        failed.needs_human = true;
        failed.response = kUnparseableResponseText;
        failed.confidence = 0.0;
        return failed;
    }

    ClassifierResult r;
    if (root.isMember("intent") && root["intent"].isString()) {
        r.intent = root["intent"].asString();
    }
    if (root.isMember("needs_human") && root["needs_human"].isBool()) {
        r.needs_human = root["needs_human"].asBool();
    }
    if (root.isMember("response") && root["response"].isString()) {
        r.response = root["response"].asString();
    } else {
        r.response = kMissingResponseText;
        r.needs_human = true;
    }
    if (root.isMember("confidence") && root["confidence"].isNumeric()) {
        r.confidence = root["confidence"].asDouble();
    }
    return r;
}

ClassifierResult classifier_unavailable_result() {
    ClassifierResult r;
    r.intent = "outros";
    r.needs_human = true;
    r.response = kUnavailableResponseText;
    r.confidence = 0.0;
    return r;
}

} // namespace support_router
