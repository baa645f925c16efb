#include "cipherledger/ledger/contentledger.hpp"
#include "access/tokenstore.hpp"
#include "core/errors.hpp"
#include "logging/logging.hpp"
#include "registry/contentregistry.hpp"
#include <openssl/rand.h>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <utility>

namespace cipherledger::ledger {

namespace {

constexpr size_t AUDIT_KEY_SIZE = 32;

std::vector<uint8_t> auditKey(const config::AuditConfig& config) {
    if (!config.hmacKey.empty()) {
        return config.hmacKey;
    }
    if (config.persistent()) {
        throw InvalidInput("an audit MAC key is required for the audit store at " +
                           config.databasePath);
    }
    std::vector<uint8_t> key(AUDIT_KEY_SIZE);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        throw std::runtime_error("Failed to generate audit MAC key");
    }
    return key;
}

// Log a rejected operation at debug level and let the error through
template<typename F>
auto logRejection(const char* operation, F&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const LedgerError& e) {
        CIPHERLEDGER_LOG_DEBUG("operation rejected",
                               {logging::StringField("op", operation),
                                logging::StringField("kind", errorCodeName(e.code())),
                                logging::StringField("reason", e.what())});
        throw;
    }
}

// Oracle responses in flight; closing waits for them to finish
class ResponseGate {
public:
    bool enter() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        ++inFlight_;
        return true;
    }

    void leave() {
        std::lock_guard<std::mutex> lock(mutex_);
        --inFlight_;
        idle_.notify_all();
    }

    void close() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        idle_.wait(lock, [this] { return inFlight_ == 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable idle_;
    size_t inFlight_ = 0;
    bool closed_ = false;
};

} // namespace

class ContentLedger::Impl {
public:
    Impl(const config::LedgerConfig& config,
         std::shared_ptr<core::EncryptionCapability> capability,
         std::shared_ptr<core::TimeSource> clock)
        : capability_(std::move(capability)),
          clock_(clock ? std::move(clock) : std::make_shared<core::SystemTimeSource>()),
          registry_(requireCapability(capability_)),
          tokens_(*capability_),
          grants_(registry_, tokens_, *capability_, config.ledger.maxAccessDuration),
          audit_(config.audit.databasePath, auditKey(config.audit)),
          responses_(std::make_shared<ResponseGate>()) {

        // Registry and token state start empty, so replaying onto an old
        // stream would hand out ids it already records
        if (audit_.size() != 0) {
            throw InvalidInput("audit store " + config.audit.databasePath + " already holds " +
                               std::to_string(audit_.size()) + " events");
        }

        auto oracleKey = config.oracle.publicKey.empty()
            ? capability_->oracleVerificationKey()
            : config.oracle.publicKey;
        if (!oracleKey.empty()) {
            gateway_ = std::make_unique<oracle::DecryptionGateway>(
                *capability_, std::move(oracleKey), responseSink());
        } else {
            CIPHERLEDGER_LOG_WARN("no oracle verification key, decryption requests disabled");
        }

        CIPHERLEDGER_LOG_INFO("content ledger ready",
                              {logging::StringField("system_principal", capability_->systemPrincipal()),
                               logging::IntField("max_access_duration_s",
                                                 config.ledger.maxAccessDuration.count()),
                               logging::UintField("audit_events", audit_.size())});
    }

    ~Impl() {
        responses_->close();
    }

    ContentId createContent(const PrincipalId& creator,
                            const core::Plaintext& payload,
                            uint64_t price,
                            const std::string& title,
                            const std::string& description) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = clock_->now();

        ContentId id = registry_.createContent(creator, payload, price, title, description, now);
        try {
            audit_.append(audit::contentCreated(id, creator, title, now));
        } catch (...) {
            registry_.discard(id);
            throw;
        }

        CIPHERLEDGER_LOG_INFO("content created",
                              {logging::UintField("content_id", id),
                               logging::StringField("creator", creator)});
        return id;
    }

    TokenId purchaseAccess(const PrincipalId& buyer,
                           ContentId contentId,
                           std::chrono::seconds duration) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = clock_->now();

        auto receipt = grants_.purchase(buyer, contentId, duration, now);
        try {
            audit_.append(audit::accessPurchased(contentId, buyer, receipt.tokenId,
                                                 receipt.expiresAt, now));
        } catch (...) {
            grants_.rollback(receipt);
            throw;
        }

        CIPHERLEDGER_LOG_INFO("access purchased",
                              {logging::UintField("content_id", contentId),
                               logging::StringField("buyer", buyer),
                               logging::UintField("token_id", receipt.tokenId),
                               logging::IntField("duration_s", duration.count())});
        return receipt.tokenId;
    }

    core::CiphertextHandle accessContent(const PrincipalId& caller, ContentId contentId) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = clock_->now();

        core::CiphertextHandle payload = grants_.accessContent(caller, contentId, now);
        audit_.append(audit::contentAccessed(contentId, caller, now));
        return payload;
    }

    void revokeAccess(const PrincipalId& caller, ContentId contentId, const PrincipalId& user) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = clock_->now();

        auto receipt = grants_.revoke(caller, contentId, user);
        try {
            audit_.append(audit::accessRevoked(contentId, user, receipt.tokenId, now));
        } catch (...) {
            grants_.rollback(receipt);
            throw;
        }

        CIPHERLEDGER_LOG_INFO("access revoked",
                              {logging::UintField("content_id", contentId),
                               logging::StringField("user", user)});
    }

    void setActive(ContentId contentId, const PrincipalId& caller, bool isActive) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = clock_->now();

        bool previous = registry_.setActive(contentId, caller, isActive);
        try {
            audit_.append(audit::contentStatusChanged(contentId, caller, isActive, now));
        } catch (...) {
            registry_.setActive(contentId, caller, previous);
            throw;
        }

        CIPHERLEDGER_LOG_INFO("content status changed",
                              {logging::UintField("content_id", contentId),
                               logging::BoolField("active", isActive)});
    }

    bool checkAccess(ContentId contentId, const PrincipalId& user) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return grants_.checkAccess(contentId, user, clock_->now());
    }

    ContentInfo getInfo(ContentId contentId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto summary = registry_.getInfo(contentId);
        return ContentInfo{summary.creator, summary.title, summary.description,
                           summary.createdAt, summary.active};
    }

    std::vector<ContentId> listContentByOwner(const PrincipalId& owner) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return registry_.listByOwner(owner);
    }

    std::vector<TokenId> listTokensByOwner(const PrincipalId& owner) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tokens_.listByOwner(owner);
    }

    TokenInfo getTokenInfo(TokenId tokenId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto summary = tokens_.info(tokenId);
        return TokenInfo{summary.contentId, summary.owner, summary.expiresAt, summary.valid};
    }

    uint64_t totalContentCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return registry_.count();
    }

    uint64_t totalTokenCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tokens_.count();
    }

    std::optional<access::AccessGrant> getGrant(ContentId contentId, const PrincipalId& user) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return grants_.getGrant(contentId, user);
    }

    RequestId requestContentDecryption(const PrincipalId& caller,
                                       ContentId contentId,
                                       oracle::DecryptionHandler handler) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = clock_->now();

        const auto& payload = grants_.accessContent(caller, contentId, now);
        if (!gateway_) {
            throw InvalidInput("no decryption oracle is configured");
        }

        RequestId requestId = gateway_->submit(contentId, caller, payload, std::move(handler));
        try {
            audit_.append(audit::decryptionRequested(contentId, caller, requestId, now));
        } catch (...) {
            gateway_->cancel(requestId);
            throw;
        }

        CIPHERLEDGER_LOG_INFO("decryption requested",
                              {logging::UintField("content_id", contentId),
                               logging::StringField("user", caller),
                               logging::UintField("request_id", requestId)});
        return requestId;
    }

    bool completeDecryption(RequestId requestId,
                            const std::vector<core::Plaintext>& cleartexts,
                            const std::vector<uint8_t>& signature) {
        oracle::DecryptionHandler handler;
        oracle::DecryptionResult result;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (!gateway_) {
                throw NotFound("no pending decryption request " + std::to_string(requestId));
            }
            auto now = clock_->now();

            auto request = gateway_->complete(requestId, cleartexts, signature);

            const auto* item = registry_.find(request.contentId);
            if (!item || !item->active ||
                !grants_.checkAccess(request.contentId, request.requester, now)) {
                CIPHERLEDGER_LOG_WARN("discarded decryption for a requester without access",
                                      {logging::UintField("request_id", requestId),
                                       logging::UintField("content_id", request.contentId),
                                       logging::StringField("user", request.requester)});
                return false;
            }

            try {
                audit_.append(audit::decryptionFulfilled(request.contentId, request.requester,
                                                         requestId, now));
            } catch (...) {
                gateway_->restore(std::move(request));
                throw;
            }

            result.requestId = requestId;
            result.contentId = request.contentId;
            result.requester = request.requester;
            result.cleartexts = cleartexts;
            handler = std::move(request.handler);
        }

        CIPHERLEDGER_LOG_INFO("decryption fulfilled",
                              {logging::UintField("request_id", requestId),
                               logging::UintField("content_id", result.contentId)});
        if (handler) {
            handler(result);
        }
        return true;
    }

    size_t pendingDecryptions() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return gateway_ ? gateway_->pending() : 0;
    }

    audit::AuditLog& auditLog() { return audit_; }

private:
    std::shared_ptr<core::EncryptionCapability> capability_;
    std::shared_ptr<core::TimeSource> clock_;
    mutable std::shared_mutex mutex_;

    registry::ContentRegistry registry_;
    access::TokenStore tokens_;
    access::GrantLedger grants_;
    audit::AuditLog audit_;

    // Closed with the ledger so late oracle responses are dropped
    std::shared_ptr<ResponseGate> responses_;
    std::unique_ptr<oracle::DecryptionGateway> gateway_;

    static core::EncryptionCapability& requireCapability(
        const std::shared_ptr<core::EncryptionCapability>& capability) {
        if (!capability) {
            throw InvalidInput("an encryption capability is required");
        }
        return *capability;
    }

    core::DecryptionCallback responseSink() {
        std::shared_ptr<ResponseGate> gate = responses_;
        return [this, gate](RequestId requestId,
                            std::vector<core::Plaintext> cleartexts,
                            std::vector<uint8_t> signature) {
            if (!gate->enter()) {
                CIPHERLEDGER_LOG_WARN("dropped oracle response for a closed ledger",
                                      {logging::UintField("request_id", requestId)});
                return;
            }
            struct Leave {
                ResponseGate& gate;
                ~Leave() { gate.leave(); }
            } leave{*gate};

            try {
                completeDecryption(requestId, cleartexts, signature);
            } catch (const LedgerError& e) {
                CIPHERLEDGER_LOG_WARN("oracle response not accepted",
                                      {logging::UintField("request_id", requestId),
                                       logging::StringField("kind", errorCodeName(e.code())),
                                       logging::StringField("reason", e.what())});
            }
        };
    }
};

ContentLedger::ContentLedger(const config::LedgerConfig& config,
                             std::shared_ptr<core::EncryptionCapability> capability,
                             std::shared_ptr<core::TimeSource> clock)
    : impl_(std::make_unique<Impl>(config, std::move(capability), std::move(clock))) {}

ContentLedger::~ContentLedger() = default;

ContentId ContentLedger::createContent(const PrincipalId& creator,
                                       const core::Plaintext& payload,
                                       uint64_t price,
                                       const std::string& title,
                                       const std::string& description) {
    return logRejection("createContent", [&] {
        return impl_->createContent(creator, payload, price, title, description);
    });
}

TokenId ContentLedger::purchaseAccess(const PrincipalId& buyer,
                                      ContentId contentId,
                                      std::chrono::seconds duration) {
    return logRejection("purchaseAccess", [&] {
        return impl_->purchaseAccess(buyer, contentId, duration);
    });
}

core::CiphertextHandle ContentLedger::accessContent(const PrincipalId& caller, ContentId contentId) {
    return logRejection("accessContent", [&] {
        return impl_->accessContent(caller, contentId);
    });
}

void ContentLedger::revokeAccess(const PrincipalId& caller, ContentId contentId, const PrincipalId& user) {
    logRejection("revokeAccess", [&] {
        impl_->revokeAccess(caller, contentId, user);
    });
}

void ContentLedger::setActive(ContentId contentId, const PrincipalId& caller, bool isActive) {
    logRejection("setActive", [&] {
        impl_->setActive(contentId, caller, isActive);
    });
}

bool ContentLedger::checkAccess(ContentId contentId, const PrincipalId& user) const {
    return impl_->checkAccess(contentId, user);
}

ContentInfo ContentLedger::getInfo(ContentId contentId) const {
    return impl_->getInfo(contentId);
}

std::vector<ContentId> ContentLedger::listContentByOwner(const PrincipalId& owner) const {
    return impl_->listContentByOwner(owner);
}

std::vector<TokenId> ContentLedger::listTokensByOwner(const PrincipalId& owner) const {
    return impl_->listTokensByOwner(owner);
}

TokenInfo ContentLedger::getTokenInfo(TokenId tokenId) const {
    return impl_->getTokenInfo(tokenId);
}

uint64_t ContentLedger::totalContentCount() const {
    return impl_->totalContentCount();
}

uint64_t ContentLedger::totalTokenCount() const {
    return impl_->totalTokenCount();
}

std::optional<access::AccessGrant> ContentLedger::getGrant(ContentId contentId,
                                                           const PrincipalId& user) const {
    return impl_->getGrant(contentId, user);
}

RequestId ContentLedger::requestContentDecryption(const PrincipalId& caller,
                                                  ContentId contentId,
                                                  oracle::DecryptionHandler handler) {
    return logRejection("requestContentDecryption", [&] {
        return impl_->requestContentDecryption(caller, contentId, std::move(handler));
    });
}

bool ContentLedger::completeDecryption(RequestId requestId,
                                       const std::vector<core::Plaintext>& cleartexts,
                                       const std::vector<uint8_t>& signature) {
    return impl_->completeDecryption(requestId, cleartexts, signature);
}

size_t ContentLedger::pendingDecryptions() const {
    return impl_->pendingDecryptions();
}

audit::AuditLog& ContentLedger::auditLog() {
    return impl_->auditLog();
}

const audit::AuditLog& ContentLedger::auditLog() const {
    return impl_->auditLog();
}

} // namespace cipherledger::ledger
