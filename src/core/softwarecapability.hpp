#pragma once

#include "core/core_export.hpp"
#include "core/crypto/signaturesystem.hpp"
#include "core/encryptioncapability.hpp"
#include "core/securememory.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace cipherledger::core {

/**
 * @brief Reference encryption capability backed by AES-256-GCM
 *
 * Stands in for an external homomorphic cryptosystem. Values are
 * encrypted under a process-local master key; a handle's value is
 * IV || ciphertext || tag.
 *
 * Decryption requests are queued and answered by processPending(), which
 * plays the external oracle: it decrypts as the system principal and
 * signs each response with its own Ed25519 key.
 */
class CIPHERLEDGER_CORE_EXPORT SoftwareCapability : public EncryptionCapability {
public:
    /**
     * @brief Constructor
     * @param systemPrincipal Principal identifying the ledger itself
     * @throws std::runtime_error if key generation fails
     */
    explicit SoftwareCapability(PrincipalId systemPrincipal);

    ~SoftwareCapability() override;

    CiphertextHandle encrypt(const Plaintext& rawValue) override;

    CiphertextHandle randomCiphertext() override;

    /**
     * @throws InvalidInput if handles is empty or contains an empty handle
     * @throws NoAccess if a handle does not allow the system principal
     */
    RequestId requestDecryption(
        const std::vector<CiphertextHandle>& handles,
        DecryptionCallback callback) override;

    std::vector<uint8_t> oracleVerificationKey() const override;

    /**
     * @brief Decrypt a handle on behalf of a principal
     * @throws NoAccess if the principal is not on the handle's allow-list
     * @throws std::runtime_error if the ciphertext fails authentication
     */
    Plaintext decrypt(const CiphertextHandle& handle, const PrincipalId& requester) const;

    /**
     * @brief Answer every queued decryption request, oldest first
     * @return Number of requests answered
     */
    size_t processPending();

    size_t pendingRequests() const;

    /**
     * @brief Fill a buffer from the OpenSSL CSPRNG
     * @return true if successful
     */
    static bool generateRandomBytes(uint8_t* output, size_t length);

private:
    struct PendingRequest {
        RequestId id;
        std::vector<CiphertextHandle> handles;
        DecryptionCallback callback;
    };

    SecureMemory::SecureVector<uint8_t> masterKey_;
    SignatureSystem signatures_;
    SignatureSystem::KeyPair oracleKeys_;

    mutable std::mutex mutex_;
    std::deque<PendingRequest> queue_;
    RequestId nextRequestId_ = 1;

    std::vector<uint8_t> seal(const Plaintext& data) const;
    Plaintext open(const std::vector<uint8_t>& sealed) const;
};

} // namespace cipherledger::core
