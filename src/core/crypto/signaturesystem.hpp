#pragma once

#include "core/core_export.hpp"
#include "core/securememory.hpp"
#include "core/types.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <vector>

namespace cipherledger::core {

/**
 * @brief Ed25519 signatures over decryption responses
 *
 * The decryption oracle signs each response it produces; the ledger
 * verifies the signature against the oracle's public key before it
 * accepts any cleartext.
 */
class CIPHERLEDGER_CORE_EXPORT SignatureSystem {
public:
    /**
     * @brief Key pair for signing operations
     */
    struct KeyPair {
        SecureMemory::SecureVector<uint8_t> privateKey;
        std::vector<uint8_t> publicKey;
    };

    SignatureSystem();
    ~SignatureSystem();

    SignatureSystem(const SignatureSystem&) = delete;
    SignatureSystem& operator=(const SignatureSystem&) = delete;

    /**
     * @brief Generate new key pair
     * @throws std::runtime_error if OpenSSL fails
     */
    KeyPair generateKeyPair();

    /**
     * @brief Sign data with private key
     * @return Signature bytes or empty if failed
     */
    std::vector<uint8_t> sign(
        const std::vector<uint8_t>& data,
        const SecureMemory::SecureVector<uint8_t>& privateKey) const;

    /**
     * @brief Verify signature with public key
     * @return true if signature is valid
     */
    bool verify(const std::vector<uint8_t>& data,
                const std::vector<uint8_t>& signature,
                const std::vector<uint8_t>& publicKey) const;

    /**
     * @brief Canonical bytes covered by a decryption response signature
     *
     * requestId (8 bytes, big-endian), cleartext count (4 bytes), then
     * each cleartext as a 4-byte length followed by its bytes.
     */
    static std::vector<uint8_t> encodeDecryptionResponse(
        RequestId requestId,
        const std::vector<Plaintext>& cleartexts);

    std::vector<uint8_t> signDecryptionResponse(
        RequestId requestId,
        const std::vector<Plaintext>& cleartexts,
        const SecureMemory::SecureVector<uint8_t>& privateKey) const;

    bool verifyDecryptionResponse(
        RequestId requestId,
        const std::vector<Plaintext>& cleartexts,
        const std::vector<uint8_t>& signature,
        const std::vector<uint8_t>& publicKey) const;

private:
    EVP_PKEY_CTX* ctx_;

    bool verifySignature(const std::vector<uint8_t>& data,
                         const std::vector<uint8_t>& signature,
                         EVP_PKEY* key) const;
};

} // namespace cipherledger::core
