#pragma once

#include "core/clock.hpp"
#include "core/core_export.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cipherledger::audit {

enum class EventType {
    ContentCreated = 1,
    AccessPurchased,
    ContentAccessed,
    AccessRevoked,
    ContentStatusChanged,
    DecryptionRequested,
    DecryptionFulfilled
};

CIPHERLEDGER_CORE_EXPORT const char* eventTypeName(EventType type);
CIPHERLEDGER_CORE_EXPORT std::optional<EventType> eventTypeFromName(const std::string& name);

/**
 * @brief One state transition of the ledger
 *
 * principal is the actor the event is about: the creator for
 * ContentCreated and ContentStatusChanged, the buyer, reader or revoked
 * user otherwise. Optional fields are set only for the event types that
 * carry them.
 */
struct Event {
    uint64_t sequence = 0;          // Assigned by append, starts at 1
    EventType type = EventType::ContentCreated;
    ContentId contentId = 0;
    PrincipalId principal;
    std::optional<TokenId> tokenId;
    std::optional<RequestId> requestId;
    std::optional<std::string> title;
    std::optional<core::TimePoint> expiresAt;
    std::optional<bool> active;
    core::TimePoint timestamp;
    std::vector<uint8_t> mac;       // HMAC-SHA256 chained to the previous event
};

CIPHERLEDGER_CORE_EXPORT Event contentCreated(ContentId contentId, const PrincipalId& creator,
                                              const std::string& title, core::TimePoint ts);
CIPHERLEDGER_CORE_EXPORT Event accessPurchased(ContentId contentId, const PrincipalId& buyer,
                                               TokenId tokenId, core::TimePoint expiresAt,
                                               core::TimePoint ts);
CIPHERLEDGER_CORE_EXPORT Event contentAccessed(ContentId contentId, const PrincipalId& user,
                                               core::TimePoint ts);
CIPHERLEDGER_CORE_EXPORT Event accessRevoked(ContentId contentId, const PrincipalId& user,
                                             std::optional<TokenId> tokenId, core::TimePoint ts);
CIPHERLEDGER_CORE_EXPORT Event contentStatusChanged(ContentId contentId, const PrincipalId& creator,
                                                    bool active, core::TimePoint ts);
CIPHERLEDGER_CORE_EXPORT Event decryptionRequested(ContentId contentId, const PrincipalId& user,
                                                   RequestId requestId, core::TimePoint ts);
CIPHERLEDGER_CORE_EXPORT Event decryptionFulfilled(ContentId contentId, const PrincipalId& user,
                                                   RequestId requestId, core::TimePoint ts);

enum class Format {
    JSON,
    CSV
};

struct TimeRange {
    core::TimePoint start;
    core::TimePoint end;
};

/**
 * @brief Event filter; unset fields match everything
 */
struct Query {
    std::optional<EventType> eventType;
    std::optional<PrincipalId> principal;
    std::optional<ContentId> contentId;
    std::optional<TimeRange> timeRange;
};

struct ExportResult {
    std::string content;
    std::vector<uint8_t> signature;   // HMAC-SHA256 over content
};

using Subscriber = std::function<void(const Event&)>;
using SubscriptionId = uint64_t;

/**
 * @brief Append-only, tamper-evident record of ledger transitions
 *
 * Events are persisted to SQLite before subscribers hear about them.
 * Reopening an existing database continues its sequence and MAC chain.
 */
class CIPHERLEDGER_CORE_EXPORT AuditLog {
public:
    /**
     * @brief Open or create the event store
     * @param dbPath SQLite path, ":memory:" for a private in-memory store
     * @param hmacKey Key for the MAC chain, must not be empty
     * @throws std::runtime_error if the database cannot be opened or the
     *         key is empty
     */
    AuditLog(const std::string& dbPath, const std::vector<uint8_t>& hmacKey);
    ~AuditLog();

    /**
     * @brief Persist an event, then notify subscribers in subscription order
     * @return Sequence number assigned to the event
     * @throws std::runtime_error if the event cannot be persisted
     */
    uint64_t append(Event event);

    SubscriptionId subscribe(Subscriber subscriber);
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Matching events in ascending sequence order
     */
    std::vector<Event> queryEvents(const Query& filter) const;

    std::vector<Event> events() const;
    size_t size() const;

    /**
     * @brief Recompute the MAC chain over the stored events
     * @return false if any stored event was altered, dropped or reordered
     */
    bool verifyIntegrity() const;

    ExportResult exportEvents(Format format) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;
};

} // namespace cipherledger::audit
