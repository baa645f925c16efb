#pragma once

#include "core/ciphertexthandle.hpp"
#include "core/core_export.hpp"
#include "core/crypto/signaturesystem.hpp"
#include "core/encryptioncapability.hpp"
#include "core/types.hpp"
#include <functional>
#include <map>
#include <vector>

namespace cipherledger::oracle {

/**
 * @brief Verified cleartext delivered to the requester's handler
 */
struct DecryptionResult {
    RequestId requestId = 0;
    ContentId contentId = 0;
    PrincipalId requester;
    std::vector<core::Plaintext> cleartexts;
};

using DecryptionHandler = std::function<void(const DecryptionResult&)>;

struct PendingDecryption {
    RequestId requestId = 0;
    ContentId contentId = 0;
    PrincipalId requester;
    DecryptionHandler handler;
};

/**
 * @brief Correlates oracle responses with the requests that caused them
 *
 * submit() hands a payload handle to the capability and remembers who
 * asked; complete() accepts a response only if the oracle's Ed25519
 * signature verifies. Responses reach the owner of the gateway through
 * the sink given at construction, never from inside submit().
 */
class CIPHERLEDGER_CORE_EXPORT DecryptionGateway {
public:
    /**
     * @param capability Capability that forwards requests to the oracle
     * @param oraclePublicKey Ed25519 key responses must verify under
     * @param responseSink Receives every oracle response
     * @throws InvalidInput if the key is not a 32-byte Ed25519 key
     */
    DecryptionGateway(core::EncryptionCapability& capability,
                      std::vector<uint8_t> oraclePublicKey,
                      core::DecryptionCallback responseSink);
    ~DecryptionGateway();

    DecryptionGateway(const DecryptionGateway&) = delete;
    DecryptionGateway& operator=(const DecryptionGateway&) = delete;

    /**
     * @brief Ask the oracle to decrypt a content payload
     * @return Correlation id of the request
     */
    RequestId submit(ContentId contentId,
                     const PrincipalId& requester,
                     const core::CiphertextHandle& payload,
                     DecryptionHandler handler);

    /**
     * @brief Accept a signed response and retire its request
     * @return The retired request
     * @throws NotFound if no request with that id is pending
     * @throws VerificationFailed if the signature does not verify; the
     *         request stays pending
     */
    PendingDecryption complete(RequestId requestId,
                               const std::vector<core::Plaintext>& cleartexts,
                               const std::vector<uint8_t>& signature);

    /**
     * @brief Forget a pending request
     * @throws NotFound if no request with that id is pending
     */
    PendingDecryption cancel(RequestId requestId);

    /**
     * @brief Put a retired request back in the pending set
     */
    void restore(PendingDecryption request);

    size_t pending() const { return pending_.size(); }

    const std::vector<uint8_t>& oraclePublicKey() const { return oraclePublicKey_; }

private:
    core::EncryptionCapability& capability_;
    core::SignatureSystem signatures_;
    std::vector<uint8_t> oraclePublicKey_;
    core::DecryptionCallback responseSink_;
    std::map<RequestId, PendingDecryption> pending_;
};

} // namespace cipherledger::oracle
