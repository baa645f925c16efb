#include "access/grantledger.hpp"
#include "core/errors.hpp"
#include <utility>

namespace cipherledger::access {

GrantLedger::GrantLedger(registry::ContentRegistry& registry,
                         TokenStore& tokens,
                         core::EncryptionCapability& capability,
                         std::chrono::seconds maxDuration)
    : registry_(registry),
      tokens_(tokens),
      capability_(capability),
      maxDuration_(maxDuration) {
    if (maxDuration_.count() < 0) {
        throw InvalidInput("maximum access duration must not be negative");
    }
}

GrantLedger::~GrantLedger() = default;

PurchaseReceipt GrantLedger::purchase(const PrincipalId& buyer,
                                      ContentId contentId,
                                      std::chrono::seconds duration,
                                      core::TimePoint now) {
    const auto& item = registry_.requireActive(contentId);

    if (buyer.empty()) {
        throw InvalidInput("buyer must be set");
    }
    if (duration.count() <= 0) {
        throw InvalidInput("access duration must be positive");
    }
    if (maxDuration_.count() > 0 && duration > maxDuration_) {
        throw InvalidInput("access duration exceeds the maximum of " +
                           std::to_string(maxDuration_.count()) + "s");
    }
    if (!core::addSeconds(now, duration)) {
        throw InvalidInput("access expiry overflows the clock");
    }

    GrantKey key{contentId, buyer};
    auto existing = grants_.find(key);
    if (existing != grants_.end() && holdsActiveAccess(existing->second, now)) {
        throw AlreadyGranted("'" + buyer + "' already holds access to content " +
                             std::to_string(contentId));
    }

    // Stage: extend decrypt rights on a copy, then issue the token
    core::CiphertextHandle payload = item.payload;
    capability_.grantDecrypt(payload, buyer);
    const auto& token = tokens_.mint(contentId, buyer, duration, now);

    PurchaseReceipt receipt;
    receipt.contentId = contentId;
    receipt.buyer = buyer;
    receipt.tokenId = token.id;
    receipt.expiresAt = token.expiresAt;
    if (existing != grants_.end()) {
        receipt.previousGrant = existing->second;
    }
    receipt.previousPayload = item.payload;

    // Commit
    AccessGrant grant;
    grant.contentId = contentId;
    grant.user = buyer;
    grant.tokenId = receipt.tokenId;
    grant.active = true;
    grant.grantedAt = now;
    try {
        grants_[key] = std::move(grant);
        registry_.replacePayload(contentId, std::move(payload));
    } catch (...) {
        rollback(receipt);
        throw;
    }
    return receipt;
}

void GrantLedger::rollback(const PurchaseReceipt& receipt) {
    GrantKey key{receipt.contentId, receipt.buyer};
    if (receipt.previousGrant) {
        grants_[key] = *receipt.previousGrant;
    } else {
        grants_.erase(key);
    }
    registry_.replacePayload(receipt.contentId, receipt.previousPayload);
    tokens_.discard(receipt.tokenId);
}

RevokeReceipt GrantLedger::revoke(const PrincipalId& caller,
                                  ContentId contentId,
                                  const PrincipalId& user) {
    const auto& item = registry_.get(contentId);
    if (caller.empty() || caller != item.creator) {
        throw Unauthorized("only the creator may revoke access to content " +
                           std::to_string(contentId));
    }

    auto it = grants_.find(GrantKey{contentId, user});
    if (it == grants_.end() || !it->second.active) {
        throw NoAccess("'" + user + "' holds no active grant on content " +
                       std::to_string(contentId));
    }

    auto& grant = it->second;
    RevokeReceipt receipt;
    receipt.contentId = contentId;
    receipt.user = user;
    receipt.tokenId = grant.tokenId;
    if (grant.tokenId) {
        receipt.tokenWasValid = tokens_.invalidate(*grant.tokenId);
    }
    grant.active = false;
    return receipt;
}

void GrantLedger::rollback(const RevokeReceipt& receipt) {
    auto it = grants_.find(GrantKey{receipt.contentId, receipt.user});
    if (it != grants_.end()) {
        it->second.active = true;
    }
    if (receipt.tokenId) {
        tokens_.reinstate(*receipt.tokenId, receipt.tokenWasValid);
    }
}

bool GrantLedger::checkAccess(ContentId contentId,
                              const PrincipalId& user,
                              core::TimePoint now) const {
    const auto* item = registry_.find(contentId);
    if (!item || user.empty()) {
        return false;
    }
    if (user == item->creator) {
        return true;
    }

    auto it = grants_.find(GrantKey{contentId, user});
    return it != grants_.end() && holdsActiveAccess(it->second, now);
}

const core::CiphertextHandle& GrantLedger::accessContent(const PrincipalId& caller,
                                                         ContentId contentId,
                                                         core::TimePoint now) const {
    const auto& item = registry_.requireActive(contentId);
    if (!checkAccess(contentId, caller, now)) {
        throw NoAccess("'" + caller + "' may not read content " +
                       std::to_string(contentId));
    }
    return item.payload;
}

std::optional<AccessGrant> GrantLedger::getGrant(ContentId contentId,
                                                 const PrincipalId& user) const {
    auto it = grants_.find(GrantKey{contentId, user});
    if (it == grants_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool GrantLedger::holdsActiveAccess(const AccessGrant& grant, core::TimePoint now) const {
    return grant.active && grant.tokenId && tokens_.isUsable(*grant.tokenId, now);
}

} // namespace cipherledger::access
