// =============================================================================
// FILE: src/channel/openai_classifier.cpp
// =============================================================================
#include "channel/openai_classifier.h"
#include "common/logger.h"
#include <json/json.h>
#include <fstream>
#include <sstream>

namespace support_router {

namespace {

const char* const kDefaultSystemPrompt =
    "Você é o assistente virtual de atendimento via WhatsApp. Responda de forma "
    "breve, educada e objetiva. Nunca invente informações: se não souber, "
    "encaminhe para um humano (needs_human=true).\n"
    "Classifique a mensagem em uma das intenções: contas_pagar, compras, "
    "contas_receber, comercial, rh, atendente, geral, outros.\n"
    "Use 'atendente' quando o cliente pedir para falar com uma pessoa. "
    "Para contas_pagar, compras, contas_receber, comercial, rh e atendente "
    "marque needs_human=true; para geral tente resolver (needs_human=false).\n"
    "Responda SEMPRE em JSON: {\"intent\": \"...\", \"needs_human\": true|false, "
    "\"response\": \"...\", \"confidence\": 0.0 a 1.0}";

const char* const kOutOfHoursNotice =
    "[ATENÇÃO: Fora do horário comercial. Informe que o atendimento humano está "
    "disponível apenas em horário comercial.]";

} // namespace

OpenAiClassifier::OpenAiClassifier(const Config& config)
    : endpoint_(config.classifier_endpoint)
    , api_key_(config.classifier_api_key)
    , model_(config.classifier_model)
    , temperature_(config.classifier_temperature)
    , max_tokens_(config.classifier_max_tokens)
    , system_prompt_(load_prompt(config.classifier_prompt_file))
    , http_(config.classifier_timeout)
{
    if (api_key_.empty()) {
        LOG_WARN("OpenAiClassifier: no api_key configured, replies will be degraded");
    }
}

std::string OpenAiClassifier::load_prompt(const std::string& path) {
    if (path.empty()) return kDefaultSystemPrompt;

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("OpenAiClassifier: cannot read prompt file '%s', using built-in prompt",
                 path.c_str());
        return kDefaultSystemPrompt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string prompt = ss.str();
    if (prompt.empty()) return kDefaultSystemPrompt;
    LOG_INFO("OpenAiClassifier: system prompt loaded from '%s' (%zu bytes)",
             path.c_str(), prompt.size());
    return prompt;
}

std::string OpenAiClassifier::build_user_prompt(const std::string& message,
                                                const std::string& customer_name,
                                                bool is_business_hours) {
    std::string prompt = "Mensagem do cliente: " + message;
    if (!customer_name.empty()) {
        prompt = "Cliente: " + customer_name + "\n" + prompt;
    }
    if (!is_business_hours) {
        prompt += "\n\n";
        prompt += kOutOfHoursNotice;
    }
    return prompt;
}

std::string OpenAiClassifier::build_request_body(const std::string& message,
                                                 const std::vector<ContextEntry>& context,
                                                 const std::string& customer_name,
                                                 bool is_business_hours) const {
    Json::Value messages(Json::arrayValue);

    Json::Value sys(Json::objectValue);
    sys["role"] = "system";
    sys["content"] = system_prompt_;
    messages.append(sys);

    for (const auto& turn : context) {
        Json::Value m(Json::objectValue);
        m["role"] = turn.role;
        m["content"] = turn.content;
        messages.append(m);
    }

    Json::Value user(Json::objectValue);
    user["role"] = "user";
    user["content"] = build_user_prompt(message, customer_name, is_business_hours);
    messages.append(user);

    Json::Value req(Json::objectValue);
    req["model"] = model_;
    req["messages"] = messages;
    req["temperature"] = temperature_;
    req["max_tokens"] = max_tokens_;
    req["response_format"]["type"] = "json_object";

    Json::StreamWriterBuilder w;
    w["indentation"] = "";
    return Json::writeString(w, req);
}

ClassifierResult OpenAiClassifier::analyze(const std::string& message,
                                           const std::vector<ContextEntry>& context,
                                           const std::string& customer_name,
                                           bool is_business_hours) {
    stats_.requests.fetch_add(1, std::memory_order_relaxed);

    HeaderMap headers;
    headers["Authorization"] = "Bearer " + api_key_;
    HttpResponse resp = http_.post_json(
        endpoint_, build_request_body(message, context, customer_name, is_business_hours),
        headers);

    if (!resp.ok()) {
        stats_.failures.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("OpenAiClassifier: request failed: %s", resp.error.c_str());
        return classifier_unavailable_result();
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream in(resp.body);
    if (!Json::parseFromStream(builder, in, &root, &errs) || !root.isObject()) {
        stats_.failures.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("OpenAiClassifier: unreadable completion envelope: %s", errs.c_str());
        return classifier_unavailable_result();
    }

    const Json::Value& choices = root["choices"];
    if (!choices.isArray() || choices.empty() ||
        !choices[0u]["message"]["content"].isString()) {
        stats_.failures.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("OpenAiClassifier: completion without message content");
        return classifier_unavailable_result();
    }

    std::string content = choices[0u]["message"]["content"].asString();
    LOG_DEBUG("OpenAiClassifier: reply %s", content.c_str());
    return parse_classifier_reply(content);
}

} // namespace support_router
