// =============================================================================
// FILE: src/common/config.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include <thread>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cstdlib>

namespace support_router {

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

size_t default_worker_count() {
    unsigned int hw = std::thread::hardware_concurrency();
    return (hw > 0) ? hw : 4;
}

} // namespace

std::unordered_map<std::string, std::string> Config::parse_ini(const std::string& path) {
    std::unordered_map<std::string, std::string> map;
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: %s", path.c_str());
        return map;
    }

    std::string section, line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            auto end = line.find(']');
            if (end != std::string::npos) section = line.substr(1, end - 1);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        trim(key);
        trim(val);

        // ${ENV_VAR} substitution; unset variables expand to ""
        size_t pos = 0;
        while ((pos = val.find("${", pos)) != std::string::npos) {
            auto end = val.find('}', pos);
            if (end == std::string::npos) break;
            std::string env_name = val.substr(pos + 2, end - pos - 2);
            const char* env_val = std::getenv(env_name.c_str());
            std::string replacement = env_val ? env_val : "";
            val.replace(pos, end - pos + 1, replacement);
            pos += replacement.size();
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        map[full_key] = val;
    }
    return map;
}

std::string Config::get_or(const std::unordered_map<std::string, std::string>& m,
                            const std::string& key, const std::string& def) {
    auto it = m.find(key); return (it != m.end()) ? it->second : def;
}

int Config::get_int(const std::unordered_map<std::string, std::string>& m,
                     const std::string& key, int def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        LOG_WARN("Config: '%s' is not an integer ('%s'), using %d",
                 key.c_str(), it->second.c_str(), def);
        return def;
    }
}

size_t Config::get_size(const std::unordered_map<std::string, std::string>& m,
                         const std::string& key, size_t def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        return std::stoull(it->second);
    } catch (const std::exception&) {
        LOG_WARN("Config: '%s' is not a size ('%s'), using %zu",
                 key.c_str(), it->second.c_str(), def);
        return def;
    }
}

double Config::get_double(const std::unordered_map<std::string, std::string>& m,
                           const std::string& key, double def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        LOG_WARN("Config: '%s' is not a number ('%s'), using %.3f",
                 key.c_str(), it->second.c_str(), def);
        return def;
    }
}

bool Config::get_bool(const std::unordered_map<std::string, std::string>& m,
                       const std::string& key, bool def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    return (it->second == "true" || it->second == "1" || it->second == "yes");
}

std::vector<std::string> Config::split_csv(const std::string& csv) {
    std::vector<std::string> out;
    std::istringstream stream(csv);
    std::string token;
    while (std::getline(stream, token, ',')) {
        trim(token);
        if (!token.empty()) out.push_back(token);
    }
    return out;
}

std::vector<IntentRoute> Config::parse_intent_routes(const std::string& csv) {
    std::vector<IntentRoute> routes;
    for (const auto& token : split_csv(csv)) {
        auto colon = token.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= token.size()) {
            LOG_WARN("Config: ignoring malformed intent route '%s'", token.c_str());
            continue;
        }
        std::string intent = token.substr(0, colon);
        std::string sector = token.substr(colon + 1);
        trim(intent);
        trim(sector);
        routes.emplace_back(intent, sector);
    }
    return routes;
}

Config Config::load_defaults() {
    Config cfg;
    cfg.num_workers = default_worker_count();
    LOG_INFO("Config: defaults loaded, %zu workers", cfg.num_workers);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    auto m = parse_ini(path);
    if (m.empty()) {
        LOG_WARN("Config: empty or missing file '%s', using defaults", path.c_str());
        return load_defaults();
    }

    Config c;

    // General
    c.service_id     = get_or(m, "general.service_id", c.service_id);
    c.instance_name  = get_or(m, "general.instance_name", c.instance_name);
    c.log_level_str  = get_or(m, "general.log_level", c.log_level_str);

    // Dispatcher
    c.num_workers = get_size(m, "dispatcher.num_workers", 0);
    if (c.num_workers == 0) c.num_workers = default_worker_count();
    c.max_pending_per_worker = get_size(m, "dispatcher.max_pending_per_worker", c.max_pending_per_worker);
    c.debounce_window  = Millisecs(get_int(m, "dispatcher.debounce_window_ms", 2000));
    c.debounce_key_ttl = Seconds(get_int(m, "dispatcher.debounce_key_ttl_sec", 60));

    // Context
    c.context_max_entries = get_size(m, "context.max_entries", c.context_max_entries);
    c.context_ttl = Seconds(get_int(m, "context.ttl_hours", 24) * 3600);

    // Dedup
    c.dedup_text_ttl     = Seconds(get_int(m, "dedup.text_ttl_sec", 15));
    c.dedup_app_link_ttl = Seconds(get_int(m, "dedup.app_link_ttl_sec", 60));
    c.dedup_app_link_key = get_or(m, "dedup.app_link_key", c.dedup_app_link_key);
    if (m.count("dedup.app_link_markers")) {
        c.dedup_app_link_markers = split_csv(m["dedup.app_link_markers"]);
    }

    // Routing
    if (m.count("routing.sectors")) {
        auto sectors = split_csv(m["routing.sectors"]);
        if (sectors.empty()) {
            LOG_WARN("Config: routing.sectors is empty, keeping built-in sector list");
        } else {
            c.sectors = std::move(sectors);
        }
    }
    if (m.count("routing.intent_map")) {
        c.intent_routes = parse_intent_routes(m["routing.intent_map"]);
    }
    c.fallback_sector        = get_or(m, "routing.fallback_sector", c.fallback_sector);
    c.notify_fallback_sector = get_or(m, "routing.notify_fallback_sector", c.notify_fallback_sector);
    c.reactivation_window    = Hours(get_int(m, "routing.reactivation_window_hours", 24));

    // Business hours
    c.hours_weekday_start = get_or(m, "business_hours.weekday_start", c.hours_weekday_start);
    c.hours_weekday_end   = get_or(m, "business_hours.weekday_end", c.hours_weekday_end);
    c.hours_saturday_open = get_bool(m, "business_hours.saturday_open", c.hours_saturday_open);
    c.hours_saturday_end  = get_or(m, "business_hours.saturday_end", c.hours_saturday_end);
    c.hours_sunday_open   = get_bool(m, "business_hours.sunday_open", c.hours_sunday_open);

    // Classifier
    c.classifier_endpoint    = get_or(m, "classifier.endpoint", c.classifier_endpoint);
    c.classifier_api_key     = get_or(m, "classifier.api_key", c.classifier_api_key);
    c.classifier_model       = get_or(m, "classifier.model", c.classifier_model);
    c.classifier_prompt_file = get_or(m, "classifier.prompt_file", c.classifier_prompt_file);
    c.classifier_temperature = get_double(m, "classifier.temperature", c.classifier_temperature);
    c.classifier_max_tokens  = get_int(m, "classifier.max_tokens", c.classifier_max_tokens);
    c.classifier_timeout     = Millisecs(get_int(m, "classifier.timeout_ms", 20000));

    // Sender
    c.sender_api_base     = get_or(m, "sender.api_base", c.sender_api_base);
    c.sender_account_sid  = get_or(m, "sender.account_sid", c.sender_account_sid);
    c.sender_auth_token   = get_or(m, "sender.auth_token", c.sender_auth_token);
    c.sender_from_number  = get_or(m, "sender.from_number", c.sender_from_number);
    c.sender_normalize_br_mobile = get_bool(m, "sender.normalize_br_mobile", false);
    c.sender_timeout      = Millisecs(get_int(m, "sender.timeout_ms", 10000));

    // Webhook
    c.webhook_verify_token = get_or(m, "webhook.verify_token", c.webhook_verify_token);

    // Redis
    c.redis_enabled         = get_bool(m, "redis.enabled", c.redis_enabled);
    c.redis_uri             = get_or(m, "redis.uri", c.redis_uri);
    c.redis_password        = get_or(m, "redis.password", c.redis_password);
    c.redis_db              = get_int(m, "redis.db", c.redis_db);
    c.redis_key_prefix      = get_or(m, "redis.key_prefix", c.redis_key_prefix);
    c.redis_pool_size       = get_size(m, "redis.pool_size", c.redis_pool_size);
    c.redis_connect_timeout = Millisecs(get_int(m, "redis.connect_timeout_ms", 1500));
    c.redis_socket_timeout  = Millisecs(get_int(m, "redis.socket_timeout_ms", 1000));

    // MongoDB
    c.mongo_uri                      = get_or(m, "mongodb.uri", c.mongo_uri);
    c.mongo_database                 = get_or(m, "mongodb.database", c.mongo_database);
    c.mongo_collection_customers     = get_or(m, "mongodb.collection_customers", c.mongo_collection_customers);
    c.mongo_collection_conversations = get_or(m, "mongodb.collection_conversations", c.mongo_collection_conversations);
    c.mongo_collection_messages      = get_or(m, "mongodb.collection_messages", c.mongo_collection_messages);
    c.mongo_collection_counters      = get_or(m, "mongodb.collection_counters", c.mongo_collection_counters);
    c.mongo_pool_min_size            = get_int(m, "mongodb.pool_min_size", c.mongo_pool_min_size);
    c.mongo_pool_max_size            = get_int(m, "mongodb.pool_max_size", c.mongo_pool_max_size);
    c.mongo_write_concern            = get_or(m, "mongodb.write_concern", c.mongo_write_concern);
    c.mongo_read_preference          = get_or(m, "mongodb.read_preference", c.mongo_read_preference);
    c.mongo_connect_timeout          = Millisecs(get_int(m, "mongodb.connect_timeout_ms", 5000));
    c.mongo_socket_timeout           = Millisecs(get_int(m, "mongodb.socket_timeout_ms", 10000));
    c.mongo_enable_persistence       = get_bool(m, "mongodb.enable_persistence", true);

    // Slow event
    c.slow_event_warn_threshold     = Millisecs(get_int(m, "slow_event.warn_threshold_ms", 1500));
    c.slow_event_error_threshold    = Millisecs(get_int(m, "slow_event.error_threshold_ms", 5000));
    c.slow_event_critical_threshold = Millisecs(get_int(m, "slow_event.critical_threshold_ms", 15000));

    // HTTP
    c.http_enabled         = get_bool(m, "http.enabled", true);
    c.http_bind_address    = get_or(m, "http.bind_address", c.http_bind_address);
    c.http_port            = static_cast<uint16_t>(get_int(m, "http.port", 8080));
    c.http_read_timeout    = Seconds(get_int(m, "http.read_timeout_sec", 30));
    c.http_max_connections = get_size(m, "http.max_connections", 100);
    c.http_max_body_bytes  = get_size(m, "http.max_body_bytes", c.http_max_body_bytes);

    // Logging
    c.log_directory         = get_or(m, "logging.directory", c.log_directory);
    c.log_base_name         = get_or(m, "logging.base_name", c.log_base_name);
    c.log_console_level_str = get_or(m, "logging.console_level", c.log_console_level_str);
    c.log_max_file_size_mb  = get_size(m, "logging.max_file_size_mb", 50);
    c.log_max_rotated_files = get_int(m, "logging.max_rotated_files", 10);

    LOG_INFO("Config: loaded from '%s', %zu workers, %zu sectors, debounce=%ldms redis=%s mongo=%s http=%s:%d",
             path.c_str(), c.num_workers, c.sectors.size(),
             static_cast<long>(c.debounce_window.count()),
             c.redis_enabled ? c.redis_uri.c_str() : "disabled",
             c.mongo_enable_persistence ? "enabled" : "disabled",
             c.http_bind_address.c_str(), c.http_port);

    return c;
}

} // namespace support_router
