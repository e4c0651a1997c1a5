// =============================================================================
// FILE: include/conversation/sector_catalog.h
// =============================================================================
#ifndef CONVERSATION_SECTOR_CATALOG_H
#define CONVERSATION_SECTOR_CATALOG_H

#include "common/config.h"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace support_router {

// The authoritative list of sectors plus the intent -> sector table.
// Queue sizing, routing and sector validation all read from one instance.
//
// Every sector routes to itself. Extra routes whose target is not a known
// sector are dropped at construction. Lookups are ASCII case-insensitive.
class SectorCatalog {
public:
    SectorCatalog(const std::vector<std::string>& sectors,
                  const std::vector<IntentRoute>& intent_routes);

    static SectorCatalog from_config(const Config& config);

    // Sectors in configuration order
    const std::vector<std::string>& sectors() const { return sectors_; }

    bool is_valid(const std::string& sector) const;

    // Sector for a classifier intent, or "" when the intent maps to none.
    std::string resolve_sector(const std::string& intent) const;

    static std::string to_lower(const std::string& s);

private:
    std::vector<std::string> sectors_;
    std::unordered_set<std::string> sector_set_;
    std::unordered_map<std::string, std::string> routes_;
};

} // namespace support_router
#endif // CONVERSATION_SECTOR_CATALOG_H
