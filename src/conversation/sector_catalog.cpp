// =============================================================================
// FILE: src/conversation/sector_catalog.cpp
// =============================================================================
#include "conversation/sector_catalog.h"
#include "common/logger.h"
#include <algorithm>
#include <cctype>

namespace support_router {

std::string SectorCatalog::to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

SectorCatalog::SectorCatalog(const std::vector<std::string>& sectors,
                             const std::vector<IntentRoute>& intent_routes) {
    for (const auto& raw : sectors) {
        std::string sector = to_lower(raw);
        if (sector.empty() || !sector_set_.insert(sector).second) continue;
        sectors_.push_back(sector);
        routes_[sector] = sector;
    }

    for (const auto& route : intent_routes) {
        std::string intent = to_lower(route.first);
        std::string target = to_lower(route.second);
        if (!is_valid(target)) {
            LOG_WARN("SectorCatalog: route %s -> %s ignored, unknown sector",
                     intent.c_str(), target.c_str());
            continue;
        }
        routes_[intent] = target;
    }
}

SectorCatalog SectorCatalog::from_config(const Config& config) {
    return SectorCatalog(config.sectors, config.intent_routes);
}

bool SectorCatalog::is_valid(const std::string& sector) const {
    return sector_set_.count(to_lower(sector)) > 0;
}

std::string SectorCatalog::resolve_sector(const std::string& intent) const {
    std::string key = to_lower(intent);
    auto it = routes_.find(key);
    if (it != routes_.end()) return it->second;
    return "";
}

} // namespace support_router
