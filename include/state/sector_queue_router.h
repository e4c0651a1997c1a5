// =============================================================================
// FILE: include/state/sector_queue_router.h
// =============================================================================
#ifndef STATE_SECTOR_QUEUE_ROUTER_H
#define STATE_SECTOR_QUEUE_ROUTER_H

#include "state/kv_backend.h"
#include "conversation/sector_catalog.h"
#include <map>
#include <mutex>
#include <string>

namespace support_router {

// FIFO of waiting conversations per sector, plus a membership record of
// which sector (if any) currently holds each conversation.
//
// Keys:
//   queue:<sector>        list of conversation ids, head = next to serve
//   queue:waiting         set of queued conversation ids
//   queue:sector_of:<id>  sector currently holding <id>
//
// Multi-step updates (enqueue, migrate, remove) run under one router mutex
// so that they are seen whole by other router calls in this process.
// Unknown sectors are rejected with kInvalidArgument; backend failures
// are logged and reported as kPersistenceError.
class SectorQueueRouter {
public:
    SectorQueueRouter(KvBackend& kv, const SectorCatalog& catalog);

    Result enqueue(const std::string& sector, ConversationId id);

    // Pops the head of the sector queue. kNotFound when empty.
    Result dequeue_next(const std::string& sector, ConversationId& out);

    // Deletes every occurrence of id from the sector queue.
    Result remove(const std::string& sector, ConversationId id);

    // Removes id from whatever queue holds it; kOk when it held none.
    Result remove_anywhere(ConversationId id);

    // Moves id from one sector queue to the tail of another.
    Result migrate(const std::string& from, const std::string& to, ConversationId id);

    // Sector holding id, "" when not queued (or unreadable).
    std::string sector_of(ConversationId id);

    // Whether any sector queue holds id; false when unreadable.
    bool is_queued(ConversationId id);

    // Count for every catalog sector, zero-filled.
    std::map<std::string, size_t> sizes();

    const SectorCatalog& catalog() const { return catalog_; }

private:
    static std::string queue_key(const std::string& sector) { return "queue:" + sector; }
    static std::string owner_key(ConversationId id) { return "queue:sector_of:" + std::to_string(id); }
    static constexpr const char* kWaitingKey = "queue:waiting";

    // Caller holds mu_
    void push_locked(const std::string& sector, ConversationId id);
    void drop_locked(const std::string& sector, ConversationId id);

    KvBackend& kv_;
    const SectorCatalog& catalog_;
    std::mutex mu_;
};

} // namespace support_router
#endif // STATE_SECTOR_QUEUE_ROUTER_H
