// =============================================================================
// FILE: src/state/sector_queue_router.cpp
// =============================================================================
#include "state/sector_queue_router.h"
#include "common/logger.h"

namespace support_router {

SectorQueueRouter::SectorQueueRouter(KvBackend& kv, const SectorCatalog& catalog)
    : kv_(kv), catalog_(catalog)
{}

void SectorQueueRouter::push_locked(const std::string& sector, ConversationId id) {
    std::string member = std::to_string(id);
    kv_.list_push_back(queue_key(sector), member);
    kv_.set_add(kWaitingKey, member);
    kv_.set(owner_key(id), sector, Millisecs(0));
}

void SectorQueueRouter::drop_locked(const std::string& sector, ConversationId id) {
    std::string member = std::to_string(id);
    kv_.list_remove(queue_key(sector), member);

    std::string owner;
    if (kv_.get(owner_key(id), owner) && owner == sector) {
        kv_.del(owner_key(id));
        kv_.set_remove(kWaitingKey, member);
    }
}

Result SectorQueueRouter::enqueue(const std::string& raw_sector, ConversationId id) {
    std::string sector = SectorCatalog::to_lower(raw_sector);
    if (!catalog_.is_valid(sector)) {
        LOG_WARN("SectorQueueRouter: enqueue of %ld into unknown sector '%s'",
                 static_cast<long>(id), raw_sector.c_str());
        return Result::kInvalidArgument;
    }

    std::lock_guard<std::mutex> lk(mu_);
    try {
        push_locked(sector, id);
    } catch (const std::exception& e) {
        LOG_ERROR("SectorQueueRouter: enqueue %ld into %s failed: %s",
                  static_cast<long>(id), sector.c_str(), e.what());
        return Result::kPersistenceError;
    }
    LOG_DEBUG("SectorQueueRouter: %ld queued in %s", static_cast<long>(id), sector.c_str());
    return Result::kOk;
}

Result SectorQueueRouter::dequeue_next(const std::string& raw_sector, ConversationId& out) {
    std::string sector = SectorCatalog::to_lower(raw_sector);
    if (!catalog_.is_valid(sector)) return Result::kInvalidArgument;

    std::lock_guard<std::mutex> lk(mu_);
    try {
        std::string head;
        while (kv_.list_pop_front(queue_key(sector), head)) {
            ConversationId id = 0;
            try {
                id = std::stoll(head);
            } catch (const std::exception&) {
                LOG_WARN("SectorQueueRouter: dropping malformed entry '%s' from %s",
                         head.c_str(), sector.c_str());
                continue;
            }
            // Other copies of the id may still sit further down the queue
            drop_locked(sector, id);
            out = id;
            return Result::kOk;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("SectorQueueRouter: dequeue from %s failed: %s", sector.c_str(), e.what());
        return Result::kPersistenceError;
    }
    return Result::kNotFound;
}

Result SectorQueueRouter::remove(const std::string& raw_sector, ConversationId id) {
    std::string sector = SectorCatalog::to_lower(raw_sector);
    if (!catalog_.is_valid(sector)) return Result::kInvalidArgument;

    std::lock_guard<std::mutex> lk(mu_);
    try {
        drop_locked(sector, id);
    } catch (const std::exception& e) {
        LOG_ERROR("SectorQueueRouter: remove %ld from %s failed: %s",
                  static_cast<long>(id), sector.c_str(), e.what());
        return Result::kPersistenceError;
    }
    return Result::kOk;
}

Result SectorQueueRouter::remove_anywhere(ConversationId id) {
    std::lock_guard<std::mutex> lk(mu_);
    try {
        std::string owner;
        if (!kv_.get(owner_key(id), owner)) {
            kv_.set_remove(kWaitingKey, std::to_string(id));
            return Result::kOk;
        }
        drop_locked(owner, id);
    } catch (const std::exception& e) {
        LOG_ERROR("SectorQueueRouter: remove %ld failed: %s", static_cast<long>(id), e.what());
        return Result::kPersistenceError;
    }
    return Result::kOk;
}

Result SectorQueueRouter::migrate(const std::string& raw_from, const std::string& raw_to,
                                  ConversationId id) {
    std::string from = SectorCatalog::to_lower(raw_from);
    std::string to = SectorCatalog::to_lower(raw_to);
    if (!catalog_.is_valid(to)) return Result::kInvalidArgument;

    std::lock_guard<std::mutex> lk(mu_);
    try {
        if (catalog_.is_valid(from)) {
            drop_locked(from, id);
        }
        push_locked(to, id);
    } catch (const std::exception& e) {
        LOG_ERROR("SectorQueueRouter: migrate %ld %s -> %s failed: %s",
                  static_cast<long>(id), from.c_str(), to.c_str(), e.what());
        return Result::kPersistenceError;
    }
    LOG_INFO("SectorQueueRouter: %ld moved %s -> %s",
             static_cast<long>(id), from.empty() ? "-" : from.c_str(), to.c_str());
    return Result::kOk;
}

std::string SectorQueueRouter::sector_of(ConversationId id) {
    try {
        std::string owner;
        if (kv_.get(owner_key(id), owner)) return owner;
    } catch (const std::exception& e) {
        LOG_WARN("SectorQueueRouter: membership of %ld unreadable: %s",
                 static_cast<long>(id), e.what());
    }
    return "";
}

bool SectorQueueRouter::is_queued(ConversationId id) {
    try {
        return kv_.set_contains(kWaitingKey, std::to_string(id));
    } catch (const std::exception& e) {
        LOG_WARN("SectorQueueRouter: waiting set unreadable for %ld: %s",
                 static_cast<long>(id), e.what());
        return false;
    }
}

std::map<std::string, size_t> SectorQueueRouter::sizes() {
    std::map<std::string, size_t> out;
    for (const auto& sector : catalog_.sectors()) {
        size_t n = 0;
        try {
            n = kv_.list_length(queue_key(sector));
        } catch (const std::exception& e) {
            LOG_WARN("SectorQueueRouter: size of %s unreadable: %s", sector.c_str(), e.what());
        }
        out[sector] = n;
    }
    return out;
}

} // namespace support_router
