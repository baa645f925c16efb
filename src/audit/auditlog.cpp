#include "audit/auditlog.hpp"
#include "core/securememory.hpp"
#include "logging/logging.hpp"
#include <openssl/evp.h>
#include <sqlite3.h>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cipherledger::audit {

// Schema version for database migrations
constexpr int SCHEMA_VERSION = 1;

// SQL statements
namespace sql {
    const char* CREATE_TABLES = R"(
        CREATE TABLE IF NOT EXISTS audit_events (
            sequence INTEGER PRIMARY KEY,
            event_type INTEGER NOT NULL,
            content_id INTEGER NOT NULL,
            principal TEXT NOT NULL,
            token_id INTEGER,
            request_id INTEGER,
            title TEXT,
            expires_at INTEGER,
            active INTEGER,
            timestamp INTEGER NOT NULL,
            mac BLOB NOT NULL
        );

        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );

        CREATE INDEX IF NOT EXISTS idx_timestamp ON audit_events(timestamp);
        CREATE INDEX IF NOT EXISTS idx_principal ON audit_events(principal);
        CREATE INDEX IF NOT EXISTS idx_content ON audit_events(content_id);
    )";

    const char* INSERT_VERSION = R"(
        INSERT OR IGNORE INTO schema_version (version) VALUES (?);
    )";

    const char* INSERT_EVENT = R"(
        INSERT INTO audit_events (
            sequence, event_type, content_id, principal, token_id, request_id,
            title, expires_at, active, timestamp, mac
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    const char* SELECT_EVENTS = R"(
        SELECT sequence, event_type, content_id, principal, token_id, request_id,
               title, expires_at, active, timestamp, mac
        FROM audit_events WHERE 1=1
    )";
}

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void putU64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void putString(std::vector<uint8_t>& out, const std::string& value) {
    putU64(out, value.size());
    out.insert(out.end(), value.begin(), value.end());
}

template<typename T, typename Put>
void putOptional(std::vector<uint8_t>& out, const std::optional<T>& value, Put put) {
    out.push_back(value ? 1 : 0);
    if (value) {
        put(out, *value);
    }
}

// Canonical bytes of an event; the MAC covers these plus the previous MAC
std::vector<uint8_t> encodeEvent(const Event& event) {
    std::vector<uint8_t> out;
    putU64(out, event.sequence);
    putU64(out, static_cast<uint64_t>(event.type));
    putU64(out, event.contentId);
    putString(out, event.principal);
    putOptional(out, event.tokenId, putU64);
    putOptional(out, event.requestId, putU64);
    putOptional(out, event.title, putString);
    putOptional(out, event.expiresAt, [](std::vector<uint8_t>& o, core::TimePoint tp) {
        putU64(o, static_cast<uint64_t>(core::toUnixNanos(tp)));
    });
    putOptional(out, event.active, [](std::vector<uint8_t>& o, bool b) {
        o.push_back(b ? 1 : 0);
    });
    putU64(out, static_cast<uint64_t>(core::toUnixNanos(event.timestamp)));
    return out;
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

Event baseEvent(EventType type, ContentId contentId, const PrincipalId& principal,
                core::TimePoint ts) {
    Event event;
    event.type = type;
    event.contentId = contentId;
    event.principal = principal;
    event.timestamp = ts;
    return event;
}

} // namespace

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::ContentCreated: return "ContentCreated";
        case EventType::AccessPurchased: return "AccessPurchased";
        case EventType::ContentAccessed: return "ContentAccessed";
        case EventType::AccessRevoked: return "AccessRevoked";
        case EventType::ContentStatusChanged: return "ContentStatusChanged";
        case EventType::DecryptionRequested: return "DecryptionRequested";
        case EventType::DecryptionFulfilled: return "DecryptionFulfilled";
    }
    return "Unknown";
}

std::optional<EventType> eventTypeFromName(const std::string& name) {
    for (int i = static_cast<int>(EventType::ContentCreated);
         i <= static_cast<int>(EventType::DecryptionFulfilled); ++i) {
        auto type = static_cast<EventType>(i);
        if (name == eventTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

Event contentCreated(ContentId contentId, const PrincipalId& creator,
                     const std::string& title, core::TimePoint ts) {
    auto event = baseEvent(EventType::ContentCreated, contentId, creator, ts);
    event.title = title;
    return event;
}

Event accessPurchased(ContentId contentId, const PrincipalId& buyer,
                      TokenId tokenId, core::TimePoint expiresAt, core::TimePoint ts) {
    auto event = baseEvent(EventType::AccessPurchased, contentId, buyer, ts);
    event.tokenId = tokenId;
    event.expiresAt = expiresAt;
    return event;
}

Event contentAccessed(ContentId contentId, const PrincipalId& user, core::TimePoint ts) {
    return baseEvent(EventType::ContentAccessed, contentId, user, ts);
}

Event accessRevoked(ContentId contentId, const PrincipalId& user,
                    std::optional<TokenId> tokenId, core::TimePoint ts) {
    auto event = baseEvent(EventType::AccessRevoked, contentId, user, ts);
    event.tokenId = tokenId;
    return event;
}

Event contentStatusChanged(ContentId contentId, const PrincipalId& creator,
                           bool active, core::TimePoint ts) {
    auto event = baseEvent(EventType::ContentStatusChanged, contentId, creator, ts);
    event.active = active;
    return event;
}

Event decryptionRequested(ContentId contentId, const PrincipalId& user,
                          RequestId requestId, core::TimePoint ts) {
    auto event = baseEvent(EventType::DecryptionRequested, contentId, user, ts);
    event.requestId = requestId;
    return event;
}

Event decryptionFulfilled(ContentId contentId, const PrincipalId& user,
                          RequestId requestId, core::TimePoint ts) {
    auto event = baseEvent(EventType::DecryptionFulfilled, contentId, user, ts);
    event.requestId = requestId;
    return event;
}

class AuditLog::Impl {
public:
    Impl(const std::string& dbPath, const std::vector<uint8_t>& key)
        : hmacKey_(key.begin(), key.end()) {
        if (hmacKey_.empty()) {
            throw std::runtime_error("Audit log HMAC key must not be empty");
        }
        if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
            std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Failed to open audit log database: " + error);
        }
        try {
            initializeDatabase();
            loadEvents();
        } catch (...) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }

        if (!cache_.empty() && !verifyIntegrity()) {
            CIPHERLEDGER_LOG_WARN("audit log failed integrity verification on load",
                                  {logging::StringField("path", dbPath)});
        }
    }

    ~Impl() {
        if (db_) sqlite3_close(db_);
    }

    uint64_t append(Event event) {
        std::map<SubscriptionId, Subscriber> subscribers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            event.sequence = nextSequence_;
            event.mac = generateMac(event, lastMac_);
            insertEvent(event);

            cache_.push_back(event);
            lastMac_ = event.mac;
            ++nextSequence_;
            subscribers = subscribers_;
        }

        for (const auto& entry : subscribers) {
            try {
                entry.second(event);
            } catch (const std::exception& e) {
                CIPHERLEDGER_LOG_ERROR("audit subscriber failed",
                                       {logging::UintField("subscription", entry.first),
                                        logging::UintField("sequence", event.sequence),
                                        logging::StringField("error", e.what())});
            } catch (...) {
                CIPHERLEDGER_LOG_ERROR("audit subscriber failed",
                                       {logging::UintField("subscription", entry.first),
                                        logging::UintField("sequence", event.sequence),
                                        logging::StringField("error", "unknown exception")});
            }
        }
        return event.sequence;
    }

    SubscriptionId subscribe(Subscriber subscriber) {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = nextSubscription_++;
        subscribers_.emplace(id, std::move(subscriber));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.erase(id) > 0;
    }

    std::vector<Event> queryEvents(const Query& filter) const {
        std::stringstream query;
        query << sql::SELECT_EVENTS;
        if (filter.eventType) query << " AND event_type = ?";
        if (filter.principal) query << " AND principal = ?";
        if (filter.contentId) query << " AND content_id = ?";
        if (filter.timeRange) query << " AND timestamp >= ? AND timestamp <= ?";
        query << " ORDER BY sequence ASC";

        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = prepare(query.str());

        int index = 1;
        if (filter.eventType) {
            sqlite3_bind_int(stmt.get(), index++, static_cast<int>(*filter.eventType));
        }
        if (filter.principal) {
            sqlite3_bind_text(stmt.get(), index++, filter.principal->c_str(), -1, SQLITE_TRANSIENT);
        }
        if (filter.contentId) {
            sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(*filter.contentId));
        }
        if (filter.timeRange) {
            sqlite3_bind_int64(stmt.get(), index++, core::toUnixNanos(filter.timeRange->start));
            sqlite3_bind_int64(stmt.get(), index++, core::toUnixNanos(filter.timeRange->end));
        }

        return readEvents(stmt.get());
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    bool verifyIntegrity() const {
        std::vector<Event> stored;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto stmt = prepare(std::string(sql::SELECT_EVENTS) + " ORDER BY sequence ASC");
            stored = readEvents(stmt.get());
            if (stored.size() != cache_.size()) {
                return false;
            }
        }

        std::vector<uint8_t> previous;
        uint64_t expected = 1;
        for (const auto& event : stored) {
            if (event.sequence != expected++) {
                return false;
            }
            if (generateMac(event, previous) != event.mac) {
                return false;
            }
            previous = event.mac;
        }
        return true;
    }

    ExportResult exportEvents(Format format) const {
        auto all = events();

        std::stringstream output;
        switch (format) {
            case Format::JSON: {
                nlohmann::json j = nlohmann::json::array();
                for (const auto& event : all) {
                    nlohmann::json event_json;
                    event_json["sequence"] = event.sequence;
                    event_json["type"] = eventTypeName(event.type);
                    event_json["contentId"] = event.contentId;
                    event_json["principal"] = event.principal;
                    if (event.tokenId) event_json["tokenId"] = *event.tokenId;
                    if (event.requestId) event_json["requestId"] = *event.requestId;
                    if (event.title) event_json["title"] = *event.title;
                    if (event.expiresAt) event_json["expiresAt"] = core::toUnixSeconds(*event.expiresAt);
                    if (event.active) event_json["active"] = *event.active;
                    event_json["timestamp"] = core::toUnixSeconds(event.timestamp);
                    j.push_back(event_json);
                }
                output << j.dump(2);
                break;
            }
            case Format::CSV: {
                output << "Sequence,Type,ContentID,Principal,TokenID,RequestID,Title,ExpiresAt,Active,Timestamp\n";
                for (const auto& event : all) {
                    output << event.sequence << ","
                           << eventTypeName(event.type) << ","
                           << event.contentId << ","
                           << csvField(event.principal) << ","
                           << (event.tokenId ? std::to_string(*event.tokenId) : "") << ","
                           << (event.requestId ? std::to_string(*event.requestId) : "") << ","
                           << (event.title ? csvField(*event.title) : "") << ","
                           << (event.expiresAt ? std::to_string(core::toUnixSeconds(*event.expiresAt)) : "") << ","
                           << (event.active ? (*event.active ? "true" : "false") : "") << ","
                           << core::toUnixSeconds(event.timestamp)
                           << "\n";
                }
                break;
            }
        }

        ExportResult result;
        result.content = output.str();
        result.signature = hmac(reinterpret_cast<const uint8_t*>(result.content.data()),
                                result.content.size());
        return result;
    }

private:
    sqlite3* db_ = nullptr;
    core::SecureMemory::SecureVector<uint8_t> hmacKey_;

    mutable std::mutex mutex_;
    std::vector<Event> cache_;
    std::vector<uint8_t> lastMac_;
    uint64_t nextSequence_ = 1;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId nextSubscription_ = 1;

    void initializeDatabase() {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql::CREATE_TABLES, nullptr, nullptr, &errMsg)
            != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("Failed to initialize database: " + error);
        }

        auto stmt = prepare(sql::INSERT_VERSION);
        sqlite3_bind_int(stmt.get(), 1, SCHEMA_VERSION);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("Failed to record schema version: ") +
                                     sqlite3_errmsg(db_));
        }
    }

    void loadEvents() {
        auto stmt = prepare(std::string(sql::SELECT_EVENTS) + " ORDER BY sequence ASC");
        cache_ = readEvents(stmt.get());
        if (!cache_.empty()) {
            lastMac_ = cache_.back().mac;
            nextSequence_ = cache_.back().sequence + 1;
        }
    }

    Statement prepare(const std::string& query) const {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, query.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to prepare audit query: ") +
                                     sqlite3_errmsg(db_));
        }
        return Statement(raw, sqlite3_finalize);
    }

    void insertEvent(const Event& event) {
        auto stmt = prepare(sql::INSERT_EVENT);
        sqlite3_stmt* s = stmt.get();

        sqlite3_bind_int64(s, 1, static_cast<sqlite3_int64>(event.sequence));
        sqlite3_bind_int(s, 2, static_cast<int>(event.type));
        sqlite3_bind_int64(s, 3, static_cast<sqlite3_int64>(event.contentId));
        sqlite3_bind_text(s, 4, event.principal.c_str(), -1, SQLITE_TRANSIENT);
        if (event.tokenId) {
            sqlite3_bind_int64(s, 5, static_cast<sqlite3_int64>(*event.tokenId));
        } else {
            sqlite3_bind_null(s, 5);
        }
        if (event.requestId) {
            sqlite3_bind_int64(s, 6, static_cast<sqlite3_int64>(*event.requestId));
        } else {
            sqlite3_bind_null(s, 6);
        }
        if (event.title) {
            sqlite3_bind_text(s, 7, event.title->c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(s, 7);
        }
        if (event.expiresAt) {
            sqlite3_bind_int64(s, 8, core::toUnixNanos(*event.expiresAt));
        } else {
            sqlite3_bind_null(s, 8);
        }
        if (event.active) {
            sqlite3_bind_int(s, 9, *event.active ? 1 : 0);
        } else {
            sqlite3_bind_null(s, 9);
        }
        sqlite3_bind_int64(s, 10, core::toUnixNanos(event.timestamp));
        sqlite3_bind_blob(s, 11, event.mac.data(), static_cast<int>(event.mac.size()),
                          SQLITE_TRANSIENT);

        if (sqlite3_step(s) != SQLITE_DONE) {
            throw std::runtime_error(std::string("Failed to persist audit event: ") +
                                     sqlite3_errmsg(db_));
        }
    }

    static std::vector<Event> readEvents(sqlite3_stmt* stmt) {
        std::vector<Event> events;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            Event event;
            event.sequence = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
            event.type = static_cast<EventType>(sqlite3_column_int(stmt, 1));
            event.contentId = static_cast<ContentId>(sqlite3_column_int64(stmt, 2));
            event.principal = columnText(stmt, 3);

            if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
                event.tokenId = static_cast<TokenId>(sqlite3_column_int64(stmt, 4));
            }
            if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
                event.requestId = static_cast<RequestId>(sqlite3_column_int64(stmt, 5));
            }
            if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
                event.title = columnText(stmt, 6);
            }
            if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
                event.expiresAt = core::fromUnixNanos(sqlite3_column_int64(stmt, 7));
            }
            if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
                event.active = sqlite3_column_int(stmt, 8) != 0;
            }
            event.timestamp = core::fromUnixNanos(sqlite3_column_int64(stmt, 9));

            auto macSize = sqlite3_column_bytes(stmt, 10);
            const auto* mac = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 10));
            if (mac && macSize > 0) {
                event.mac.assign(mac, mac + macSize);
            }

            events.push_back(std::move(event));
        }
        return events;
    }

    std::vector<uint8_t> generateMac(const Event& event,
                                     const std::vector<uint8_t>& previousMac) const {
        auto data = encodeEvent(event);
        data.insert(data.end(), previousMac.begin(), previousMac.end());
        return hmac(data.data(), data.size());
    }

    std::vector<uint8_t> hmac(const uint8_t* data, size_t len) const {
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
            EVP_MD_CTX_new(), EVP_MD_CTX_free);
        if (!ctx) {
            throw std::runtime_error("Failed to create MAC context");
        }

        std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(
            EVP_PKEY_new_mac_key(EVP_PKEY_HMAC, nullptr,
                                 hmacKey_.data(), static_cast<int>(hmacKey_.size())),
            EVP_PKEY_free);
        if (!pkey) {
            throw std::runtime_error("Failed to load MAC key");
        }

        if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1 ||
            EVP_DigestSignUpdate(ctx.get(), data, len) != 1) {
            throw std::runtime_error("Failed to compute audit MAC");
        }

        size_t sigLen = 0;
        if (EVP_DigestSignFinal(ctx.get(), nullptr, &sigLen) != 1) {
            throw std::runtime_error("Failed to compute audit MAC");
        }
        std::vector<uint8_t> signature(sigLen);
        if (EVP_DigestSignFinal(ctx.get(), signature.data(), &sigLen) != 1) {
            throw std::runtime_error("Failed to compute audit MAC");
        }
        signature.resize(sigLen);
        return signature;
    }
};

// Public interface implementation
AuditLog::AuditLog(const std::string& dbPath, const std::vector<uint8_t>& hmacKey)
    : impl_(std::make_unique<Impl>(dbPath, hmacKey)) {}

AuditLog::~AuditLog() = default;

uint64_t AuditLog::append(Event event) {
    return impl_->append(std::move(event));
}

SubscriptionId AuditLog::subscribe(Subscriber subscriber) {
    return impl_->subscribe(std::move(subscriber));
}

bool AuditLog::unsubscribe(SubscriptionId id) {
    return impl_->unsubscribe(id);
}

std::vector<Event> AuditLog::queryEvents(const Query& filter) const {
    return impl_->queryEvents(filter);
}

std::vector<Event> AuditLog::events() const {
    return impl_->events();
}

size_t AuditLog::size() const {
    return impl_->size();
}

bool AuditLog::verifyIntegrity() const {
    return impl_->verifyIntegrity();
}

ExportResult AuditLog::exportEvents(Format format) const {
    return impl_->exportEvents(format);
}

} // namespace cipherledger::audit
