// =============================================================================
// FILE: include/common/types.h
// =============================================================================
#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <cstdint>
#include <chrono>
#include <string>
#include <memory>
#include <functional>

namespace support_router {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;
using Millisecs = std::chrono::milliseconds;
using Seconds   = std::chrono::seconds;
using Hours     = std::chrono::hours;

// Wall clock for persisted timestamps (created_at, resolved_at, ...)
using WallClock = std::chrono::system_clock;
using WallTime  = WallClock::time_point;

using CustomerId     = int64_t;
using ConversationId = int64_t;
using MessageId      = int64_t;
using OperatorId     = int64_t;

enum class Result {
    kOk, kError, kTimeout, kNotFound, kAlreadyExists,
    kCapacityExceeded, kInvalidArgument, kShuttingDown,
    kConnectionLost, kParseError, kPersistenceError, kConflict
};

inline const char* result_to_string(Result r) {
    switch (r) {
        case Result::kOk:               return "OK";
        case Result::kError:            return "Error";
        case Result::kTimeout:          return "Timeout";
        case Result::kNotFound:         return "NotFound";
        case Result::kAlreadyExists:    return "AlreadyExists";
        case Result::kCapacityExceeded: return "CapacityExceeded";
        case Result::kInvalidArgument:  return "InvalidArgument";
        case Result::kShuttingDown:     return "ShuttingDown";
        case Result::kConnectionLost:   return "ConnectionLost";
        case Result::kParseError:       return "ParseError";
        case Result::kPersistenceError: return "PersistenceError";
        case Result::kConflict:         return "Conflict";
        default:                        return "Unknown";
    }
}

// Microseconds since the Unix epoch
inline int64_t to_epoch_us(WallTime t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        t.time_since_epoch()).count();
}

inline WallTime from_epoch_us(int64_t us) {
    return WallTime(std::chrono::duration_cast<WallClock::duration>(
        std::chrono::microseconds(us)));
}

// Scoped timer for measuring operation durations
class ScopedTimer {
public:
    ScopedTimer() : start_(Clock::now()) {}
    Millisecs elapsed_ms() const {
        return std::chrono::duration_cast<Millisecs>(Clock::now() - start_);
    }
    double elapsed_sec() const {
        return std::chrono::duration<double>(Clock::now() - start_).count();
    }
private:
    TimePoint start_;
};

} // namespace support_router
#endif // COMMON_TYPES_H
