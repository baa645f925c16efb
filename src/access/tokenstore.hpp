#pragma once

#include "core/ciphertexthandle.hpp"
#include "core/clock.hpp"
#include "core/core_export.hpp"
#include "core/encryptioncapability.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <vector>

namespace cipherledger::access {

/**
 * @brief Time-bounded capability to read one content item
 *
 * Tokens are append-only: invalidation flips the flag, nothing is ever
 * removed, and expiry is evaluated against the clock on each check.
 */
struct AccessToken {
    TokenId id = 0;
    ContentId contentId = 0;
    PrincipalId owner;
    core::TimePoint expiresAt;
    bool valid = true;
    core::CiphertextHandle accessKey;
};

struct TokenSummary {
    ContentId contentId = 0;
    PrincipalId owner;
    core::TimePoint expiresAt;
    bool valid = true;
};

class CIPHERLEDGER_CORE_EXPORT TokenStore {
public:
    explicit TokenStore(core::EncryptionCapability& capability);
    ~TokenStore();

    TokenStore(const TokenStore&) = delete;
    TokenStore& operator=(const TokenStore&) = delete;

    /**
     * @brief Issue a token with fresh random key material
     * @param contentId Content the token unlocks
     * @param owner Holder, granted decrypt on the access key
     * @param duration Validity window, strictly positive
     * @param now Issue time
     * @throws InvalidInput on an unset owner, a non-positive duration or
     *         an expiry that cannot be represented
     */
    const AccessToken& mint(ContentId contentId,
                            const PrincipalId& owner,
                            std::chrono::seconds duration,
                            core::TimePoint now);

    /**
     * @brief Mark a token invalid; idempotent
     * @return Validity before the call
     * @throws NotFound for an unknown id
     */
    bool invalidate(TokenId id);

    /**
     * @brief Valid and strictly before expiry; false for an unknown id
     */
    bool isUsable(TokenId id, core::TimePoint now) const;

    const AccessToken* find(TokenId id) const;

    /**
     * @throws NotFound for an unknown id
     */
    const AccessToken& get(TokenId id) const;

    /**
     * @throws NotFound for an unknown id
     */
    TokenSummary info(TokenId id) const;

    /**
     * @brief Ids issued to a principal, in issue order
     */
    std::vector<TokenId> listByOwner(const PrincipalId& owner) const;

    uint64_t count() const { return tokens_.size(); }

    /**
     * @brief Undo the most recent mint
     * @throws std::logic_error if id is not the most recent token
     */
    void discard(TokenId id);

    /**
     * @brief Restore the validity flag recorded before an invalidate
     * @throws NotFound for an unknown id
     */
    void reinstate(TokenId id, bool valid);

private:
    core::EncryptionCapability& capability_;
    // Token id N lives at index N - 1
    std::vector<AccessToken> tokens_;
    std::map<PrincipalId, std::vector<TokenId>> byOwner_;

    AccessToken& mutableToken(TokenId id);
};

} // namespace cipherledger::access
