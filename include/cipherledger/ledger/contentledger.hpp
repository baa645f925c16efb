#pragma once

#include "access/grantledger.hpp"
#include "audit/auditlog.hpp"
#include "config/ledgerconfig.hpp"
#include "core/ciphertexthandle.hpp"
#include "core/clock.hpp"
#include "core/core_export.hpp"
#include "core/encryptioncapability.hpp"
#include "core/types.hpp"
#include "oracle/decryptiongateway.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cipherledger::ledger {

struct ContentInfo {
    PrincipalId creator;
    std::string title;
    std::string description;
    core::TimePoint createdAt;
    bool active = true;
};

struct TokenInfo {
    ContentId contentId = 0;
    PrincipalId owner;
    core::TimePoint expiresAt;
    bool valid = true;
};

/**
 * @brief Confidential content distribution ledger
 *
 * Owns the content registry, access grants, tokens, audit log and
 * decryption gateway, and exposes them as serialized transactions.
 * Every transition validates, commits and then records its audit event;
 * if the event cannot be recorded the transition is undone and the
 * error propagates. Queries run concurrently with each other and see
 * the last completed transition.
 *
 * Audit subscribers run inside the emitting transaction and must not
 * call back into the ledger.
 *
 * The capability may deliver oracle responses on any thread. Destruction
 * waits for responses already being processed and drops later ones, so a
 * decryption handler must not destroy the ledger it was called from.
 */
class CIPHERLEDGER_CORE_EXPORT ContentLedger {
public:
    /**
     * @brief Create an empty ledger
     * @param config Ledger, audit and oracle settings
     * @param capability Encryption capability, shared with the oracle side
     * @param clock Time source for expiry; the system clock if null
     * @throws InvalidInput for an unusable configuration, a file-backed
     *         audit store without a MAC key, or an audit store that
     *         already holds events
     * @throws std::runtime_error if the audit store cannot be opened
     */
    ContentLedger(const config::LedgerConfig& config,
                  std::shared_ptr<core::EncryptionCapability> capability,
                  std::shared_ptr<core::TimeSource> clock = nullptr);
    ~ContentLedger();

    /**
     * @brief Register new content owned by creator
     * @return Id of the new content
     * @throws InvalidInput on an unset creator or empty title or description
     */
    ContentId createContent(const PrincipalId& creator,
                            const core::Plaintext& payload,
                            uint64_t price,
                            const std::string& title,
                            const std::string& description);

    /**
     * @brief Buy time-limited access
     * @return Id of the issued token
     * @throws NotFound, Inactive, InvalidInput, AlreadyGranted
     */
    TokenId purchaseAccess(const PrincipalId& buyer,
                           ContentId contentId,
                           std::chrono::seconds duration);

    /**
     * @brief Payload handle for an authorized reader
     * @throws NotFound, Inactive, NoAccess
     */
    core::CiphertextHandle accessContent(const PrincipalId& caller, ContentId contentId);

    /**
     * @throws NotFound, Unauthorized, NoAccess
     */
    void revokeAccess(const PrincipalId& caller, ContentId contentId, const PrincipalId& user);

    /**
     * @throws NotFound, Unauthorized
     */
    void setActive(ContentId contentId, const PrincipalId& caller, bool isActive);

    bool checkAccess(ContentId contentId, const PrincipalId& user) const;

    /**
     * @throws NotFound
     */
    ContentInfo getInfo(ContentId contentId) const;

    std::vector<ContentId> listContentByOwner(const PrincipalId& owner) const;
    std::vector<TokenId> listTokensByOwner(const PrincipalId& owner) const;

    /**
     * @throws NotFound
     */
    TokenInfo getTokenInfo(TokenId tokenId) const;

    uint64_t totalContentCount() const;
    uint64_t totalTokenCount() const;

    std::optional<access::AccessGrant> getGrant(ContentId contentId, const PrincipalId& user) const;

    /**
     * @brief Ask the oracle to decrypt content for an authorized reader
     *
     * The handler runs after a verified response arrives and access is
     * confirmed again, outside the ledger lock.
     *
     * @return Correlation id of the request
     * @throws NotFound, Inactive, NoAccess
     * @throws InvalidInput if no oracle key is configured
     */
    RequestId requestContentDecryption(const PrincipalId& caller,
                                       ContentId contentId,
                                       oracle::DecryptionHandler handler);

    /**
     * @brief Accept an oracle response
     * @return true if the cleartext was delivered, false if the requester
     *         lost access while the request was pending
     * @throws NotFound if no such request is pending
     * @throws VerificationFailed if the signature does not verify
     */
    bool completeDecryption(RequestId requestId,
                            const std::vector<core::Plaintext>& cleartexts,
                            const std::vector<uint8_t>& signature);

    size_t pendingDecryptions() const;

    audit::AuditLog& auditLog();
    const audit::AuditLog& auditLog() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    ContentLedger(const ContentLedger&) = delete;
    ContentLedger& operator=(const ContentLedger&) = delete;
};

} // namespace cipherledger::ledger
