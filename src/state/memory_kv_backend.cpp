// =============================================================================
// FILE: src/state/memory_kv_backend.cpp
// =============================================================================
#include "state/memory_kv_backend.h"
#include <stdexcept>

namespace support_router {

void MemoryKvBackend::apply_ttl(Entry& e, Millisecs ttl) {
    if (ttl.count() > 0) {
        e.has_expiry = true;
        e.expires_at = Clock::now() + ttl;
    } else {
        e.has_expiry = false;
    }
}

void MemoryKvBackend::require_kind(const Entry& e, Kind kind, const std::string& key) {
    if (e.kind != kind) {
        throw std::logic_error("wrong kind of value held at key '" + key + "'");
    }
}

MemoryKvBackend::Entry* MemoryKvBackend::find_live(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    if (it->second.has_expiry && Clock::now() >= it->second.expires_at) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

MemoryKvBackend::Entry& MemoryKvBackend::find_or_create(const std::string& key, Kind kind) {
    Entry* e = find_live(key);
    if (e) {
        require_kind(*e, kind, key);
        return *e;
    }
    Entry& fresh = entries_[key];
    fresh.kind = kind;
    return fresh;
}

// -----------------------------------------------------------------------------
// Plain values
// -----------------------------------------------------------------------------

bool MemoryKvBackend::get(const std::string& key, std::string& out) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return false;
    require_kind(*e, Kind::kValue, key);
    out = e->value;
    return true;
}

void MemoryKvBackend::set(const std::string& key, const std::string& value, Millisecs ttl) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry& e = entries_[key];
    e = Entry();
    e.kind = Kind::kValue;
    e.value = value;
    apply_ttl(e, ttl);
}

bool MemoryKvBackend::expire(const std::string& key, Millisecs ttl) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return false;
    apply_ttl(*e, ttl);
    return true;
}

bool MemoryKvBackend::del(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!find_live(key)) return false;
    entries_.erase(key);
    return true;
}

bool MemoryKvBackend::check_and_set(const std::string& key, const std::string& value,
                                    Millisecs ttl) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (e) {
        require_kind(*e, Kind::kValue, key);
        if (e->value == value) return true;
    }
    Entry& slot = entries_[key];
    slot = Entry();
    slot.kind = Kind::kValue;
    slot.value = value;
    apply_ttl(slot, ttl);
    return false;
}

// -----------------------------------------------------------------------------
// Lists
// -----------------------------------------------------------------------------

size_t MemoryKvBackend::list_push_back(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry& e = find_or_create(key, Kind::kList);
    e.list.push_back(value);
    return e.list.size();
}

bool MemoryKvBackend::list_pop_front(const std::string& key, std::string& out) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return false;
    require_kind(*e, Kind::kList, key);
    if (e->list.empty()) return false;
    out = std::move(e->list.front());
    e->list.pop_front();
    if (e->list.empty()) entries_.erase(key);
    return true;
}

size_t MemoryKvBackend::list_remove(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return 0;
    require_kind(*e, Kind::kList, key);

    size_t removed = 0;
    for (auto it = e->list.begin(); it != e->list.end();) {
        if (*it == value) {
            it = e->list.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (e->list.empty()) entries_.erase(key);
    return removed;
}

size_t MemoryKvBackend::list_length(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return 0;
    require_kind(*e, Kind::kList, key);
    return e->list.size();
}

std::vector<std::string> MemoryKvBackend::list_range(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return {};
    require_kind(*e, Kind::kList, key);
    return std::vector<std::string>(e->list.begin(), e->list.end());
}

void MemoryKvBackend::list_append_capped(const std::string& key, const std::string& value,
                                         size_t max_len, Millisecs ttl) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry& e = find_or_create(key, Kind::kList);
    e.list.push_back(value);
    while (max_len > 0 && e.list.size() > max_len) {
        e.list.pop_front();
    }
    apply_ttl(e, ttl);
}

// -----------------------------------------------------------------------------
// Sets
// -----------------------------------------------------------------------------

bool MemoryKvBackend::set_add(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry& e = find_or_create(key, Kind::kSet);
    return e.members.insert(member).second;
}

bool MemoryKvBackend::set_remove(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return false;
    require_kind(*e, Kind::kSet, key);
    bool removed = e->members.erase(member) > 0;
    if (e->members.empty()) entries_.erase(key);
    return removed;
}

bool MemoryKvBackend::set_contains(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return false;
    require_kind(*e, Kind::kSet, key);
    return e->members.count(member) > 0;
}

std::vector<std::string> MemoryKvBackend::set_members(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    Entry* e = find_live(key);
    if (!e) return {};
    require_kind(*e, Kind::kSet, key);
    return std::vector<std::string>(e->members.begin(), e->members.end());
}

// -----------------------------------------------------------------------------

size_t MemoryKvBackend::purge_expired() {
    std::lock_guard<std::mutex> lk(mu_);
    auto now = Clock::now();
    size_t purged = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.has_expiry && now >= it->second.expires_at) {
            it = entries_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return purged;
}

size_t MemoryKvBackend::key_count() {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

} // namespace support_router
