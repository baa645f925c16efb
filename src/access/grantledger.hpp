#pragma once

#include "access/tokenstore.hpp"
#include "core/ciphertexthandle.hpp"
#include "core/clock.hpp"
#include "core/core_export.hpp"
#include "core/encryptioncapability.hpp"
#include "core/types.hpp"
#include "registry/contentregistry.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <utility>

namespace cipherledger::access {

/**
 * @brief Access state of one (content, user) pair
 *
 * The record outlives revocation and expiry; a later purchase
 * reactivates it with a new token.
 */
struct AccessGrant {
    ContentId contentId = 0;
    PrincipalId user;
    std::optional<TokenId> tokenId;
    bool active = false;
    core::TimePoint grantedAt;
};

/**
 * @brief Everything a purchase changed, enough to undo it
 */
struct PurchaseReceipt {
    ContentId contentId = 0;
    PrincipalId buyer;
    TokenId tokenId = 0;
    core::TimePoint expiresAt;
    std::optional<AccessGrant> previousGrant;
    core::CiphertextHandle previousPayload;
};

/**
 * @brief Everything a revocation changed, enough to undo it
 */
struct RevokeReceipt {
    ContentId contentId = 0;
    PrincipalId user;
    std::optional<TokenId> tokenId;
    bool tokenWasValid = false;
};

/**
 * @brief Per-user grants over registry content
 *
 * checkAccess() is the single access gate: the creator always passes,
 * everyone else needs an active grant whose token is valid and has not
 * reached its expiry.
 *
 * Mutating calls either apply completely or throw without changing
 * anything. Receipts let the caller undo a committed change when a
 * later step of its transaction fails.
 */
class CIPHERLEDGER_CORE_EXPORT GrantLedger {
public:
    /**
     * @param maxDuration Longest purchasable window, zero for unlimited
     */
    GrantLedger(registry::ContentRegistry& registry,
                TokenStore& tokens,
                core::EncryptionCapability& capability,
                std::chrono::seconds maxDuration);
    ~GrantLedger();

    GrantLedger(const GrantLedger&) = delete;
    GrantLedger& operator=(const GrantLedger&) = delete;

    /**
     * @brief Buy time-limited access to content
     * @throws NotFound if the content does not exist
     * @throws Inactive if the content is deactivated
     * @throws InvalidInput on an unset buyer or an unusable duration
     * @throws AlreadyGranted if the buyer already holds active access
     */
    PurchaseReceipt purchase(const PrincipalId& buyer,
                             ContentId contentId,
                             std::chrono::seconds duration,
                             core::TimePoint now);

    void rollback(const PurchaseReceipt& receipt);

    /**
     * @brief Cut a user's access; decrypt rights already handed out remain
     * @throws NotFound if the content does not exist
     * @throws Unauthorized unless caller is the creator
     * @throws NoAccess if the user holds no active grant
     */
    RevokeReceipt revoke(const PrincipalId& caller,
                         ContentId contentId,
                         const PrincipalId& user);

    void rollback(const RevokeReceipt& receipt);

    bool checkAccess(ContentId contentId, const PrincipalId& user, core::TimePoint now) const;

    /**
     * @brief Payload handle for a reader who passes the access gate
     * @throws NotFound, Inactive, NoAccess
     */
    const core::CiphertextHandle& accessContent(const PrincipalId& caller,
                                                ContentId contentId,
                                                core::TimePoint now) const;

    std::optional<AccessGrant> getGrant(ContentId contentId, const PrincipalId& user) const;

    std::chrono::seconds maxDuration() const { return maxDuration_; }

private:
    using GrantKey = std::pair<ContentId, PrincipalId>;

    registry::ContentRegistry& registry_;
    TokenStore& tokens_;
    core::EncryptionCapability& capability_;
    std::chrono::seconds maxDuration_;
    std::map<GrantKey, AccessGrant> grants_;

    bool holdsActiveAccess(const AccessGrant& grant, core::TimePoint now) const;
};

} // namespace cipherledger::access
