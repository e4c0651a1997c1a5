// =============================================================================
// FILE: include/common/config.h
// =============================================================================
#ifndef COMMON_CONFIG_H
#define COMMON_CONFIG_H

#include "common/types.h"
#include <cstddef>
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>

namespace support_router {

// One "intent:sector" pair of the routing table
using IntentRoute = std::pair<std::string, std::string>;

struct Config {
    // General
    std::string service_id     = "support-router-01";
    std::string instance_name  = "support_router";
    std::string log_level_str  = "info";

    // Dispatcher
    size_t    num_workers             = 0;
    size_t    max_pending_per_worker  = 10000;
    Millisecs debounce_window         = Millisecs(2000);
    Seconds   debounce_key_ttl        = Seconds(60);

    // Context window
    size_t    context_max_entries     = 10;
    Seconds   context_ttl             = Seconds(24 * 3600);

    // Duplicate reply suppression
    Seconds   dedup_text_ttl          = Seconds(15);
    Seconds   dedup_app_link_ttl      = Seconds(60);
    std::string dedup_app_link_key    = "STATIC_KEY:APP_LINKS";
    std::vector<std::string> dedup_app_link_markers = {"play.google.com", "apps.apple.com"};

    // Routing
    std::vector<std::string> sectors = {
        "comercial", "compras", "contas_pagar", "contas_receber",
        "rh", "atendimento_humano", "geral", "outros"
    };
    std::vector<IntentRoute> intent_routes = {
        {"atendente", "atendimento_humano"}
    };
    std::string fallback_sector        = "atendimento_humano";
    std::string notify_fallback_sector = "comercial";
    Hours       reactivation_window    = Hours(24);

    // Business hours ("HH:MM", local time)
    std::string hours_weekday_start   = "08:00";
    std::string hours_weekday_end     = "18:00";
    bool        hours_saturday_open   = true;
    std::string hours_saturday_end    = "12:00";
    bool        hours_sunday_open     = false;

    // Classifier (chat-completions endpoint)
    std::string classifier_endpoint    = "https://api.openai.com/v1/chat/completions";
    std::string classifier_api_key;
    std::string classifier_model       = "gpt-4o-mini";
    std::string classifier_prompt_file;
    double      classifier_temperature = 0.7;
    int         classifier_max_tokens  = 500;
    Millisecs   classifier_timeout     = Millisecs(20000);

    // Sender (Twilio Messages API)
    std::string sender_api_base        = "https://api.twilio.com/2010-04-01";
    std::string sender_account_sid;
    std::string sender_auth_token;
    std::string sender_from_number     = "+14155238886";
    bool        sender_normalize_br_mobile = false;
    Millisecs   sender_timeout         = Millisecs(10000);

    // Webhook
    std::string webhook_verify_token   = "token-verificacao-webhook";

    // Redis (shared routing state; memory fallback when unreachable)
    bool        redis_enabled            = true;
    std::string redis_uri                = "tcp://127.0.0.1:6379";
    std::string redis_password;
    int         redis_db                 = 0;
    std::string redis_key_prefix         = "support_router:";
    size_t      redis_pool_size          = 4;
    Millisecs   redis_connect_timeout    = Millisecs(1500);
    Millisecs   redis_socket_timeout     = Millisecs(1000);

    // MongoDB
    std::string mongo_uri                    = "mongodb://localhost:27017";
    std::string mongo_database               = "support_router";
    std::string mongo_collection_customers   = "customers";
    std::string mongo_collection_conversations = "conversations";
    std::string mongo_collection_messages    = "messages";
    std::string mongo_collection_counters    = "counters";
    int         mongo_pool_min_size          = 2;
    int         mongo_pool_max_size          = 10;
    std::string mongo_write_concern          = "majority";
    std::string mongo_read_preference        = "primaryPreferred";
    Millisecs   mongo_connect_timeout        = Millisecs(5000);
    Millisecs   mongo_socket_timeout         = Millisecs(10000);
    bool        mongo_enable_persistence     = true;

    // Slow event logging thresholds
    Millisecs slow_event_warn_threshold      = Millisecs(1500);
    Millisecs slow_event_error_threshold     = Millisecs(5000);
    Millisecs slow_event_critical_threshold  = Millisecs(15000);

    // HTTP server
    bool        http_enabled            = true;
    std::string http_bind_address       = "0.0.0.0";
    uint16_t    http_port               = 8080;
    Seconds     http_read_timeout       = Seconds(30);
    size_t      http_max_connections    = 100;
    size_t      http_max_body_bytes     = 1024 * 1024;

    // Logging
    std::string log_directory           = "/var/log/support_router";
    std::string log_base_name           = "support_router";
    std::string log_console_level_str   = "warn";
    size_t      log_max_file_size_mb    = 50;
    int         log_max_rotated_files   = 10;

    // Parse from INI-style config file
    static Config load_from_file(const std::string& path);
    static Config load_defaults();

    // "a, b ,c" -> {"a","b","c"}; empty tokens dropped
    static std::vector<std::string> split_csv(const std::string& csv);

private:
    // INI parser helper
    static std::unordered_map<std::string, std::string> parse_ini(const std::string& path);
    static std::string get_or(const std::unordered_map<std::string, std::string>& m,
                               const std::string& key, const std::string& def);
    static int get_int(const std::unordered_map<std::string, std::string>& m,
                        const std::string& key, int def);
    static size_t get_size(const std::unordered_map<std::string, std::string>& m,
                            const std::string& key, size_t def);
    static double get_double(const std::unordered_map<std::string, std::string>& m,
                              const std::string& key, double def);
    static bool get_bool(const std::unordered_map<std::string, std::string>& m,
                          const std::string& key, bool def);
    static std::vector<IntentRoute> parse_intent_routes(const std::string& csv);
};

} // namespace support_router
#endif // COMMON_CONFIG_H
