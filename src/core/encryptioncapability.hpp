#pragma once

#include "core/core_export.hpp"
#include "core/ciphertexthandle.hpp"
#include "core/types.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace cipherledger::core {

/**
 * @brief Completion of a decryption request
 *
 * Invoked with the correlation id returned by requestDecryption, the
 * cleartexts in request order and the oracle's signature over both.
 */
using DecryptionCallback = std::function<void(
    RequestId requestId,
    std::vector<Plaintext> cleartexts,
    std::vector<uint8_t> signature)>;

/**
 * @brief External encryption capability consumed by the ledger
 *
 * Models a cryptosystem that computes on opaque ciphertexts. The ledger
 * never sees key material; it only encrypts, extends allow-lists,
 * draws random ciphertexts and asks an oracle to decrypt.
 *
 * Every handle created through makeHandle() allows the system principal,
 * so the ledger keeps the ability to re-derive views for future grantees.
 */
class CIPHERLEDGER_CORE_EXPORT EncryptionCapability {
public:
    /**
     * @brief Constructor
     * @param systemPrincipal Principal identifying the ledger itself
     */
    explicit EncryptionCapability(PrincipalId systemPrincipal);

    virtual ~EncryptionCapability();

    EncryptionCapability(const EncryptionCapability&) = delete;
    EncryptionCapability& operator=(const EncryptionCapability&) = delete;

    /**
     * @brief Encrypt a raw value into a fresh handle
     * @param rawValue Value to encrypt
     * @return Handle allowing only the system principal
     */
    virtual CiphertextHandle encrypt(const Plaintext& rawValue) = 0;

    /**
     * @brief Encrypt an unsigned 64-bit value (big-endian encoding)
     */
    CiphertextHandle encryptUint64(uint64_t value);

    /**
     * @brief Allow a principal to request decryption of a handle
     *
     * Idempotent. Throws InvalidInput for the unset principal.
     */
    virtual void grantDecrypt(CiphertextHandle& handle, const PrincipalId& principal);

    /**
     * @brief Fresh random key material, encrypted
     */
    virtual CiphertextHandle randomCiphertext() = 0;

    /**
     * @brief Ask the oracle to decrypt handles
     *
     * The callback is never invoked from within this call; completion
     * arrives later, keyed by the returned correlation id.
     *
     * @param handles Handles to decrypt, all of which must allow the system
     * @param callback Receives the signed response
     * @return Correlation id
     */
    virtual RequestId requestDecryption(
        const std::vector<CiphertextHandle>& handles,
        DecryptionCallback callback) = 0;

    /**
     * @brief Ed25519 key the oracle signs responses with, empty if unknown
     */
    virtual std::vector<uint8_t> oracleVerificationKey() const;

    const PrincipalId& systemPrincipal() const { return systemPrincipal_; }

    /**
     * @brief Encode an unsigned 64-bit value the way encryptUint64 does
     */
    static Plaintext encodeUint64(uint64_t value);

    /**
     * @brief Decode a value produced by encodeUint64
     * @throws InvalidInput if the length is not eight bytes
     */
    static uint64_t decodeUint64(const Plaintext& value);

protected:
    /**
     * @brief Wrap ciphertext bytes in a new handle allowing the system
     */
    CiphertextHandle makeHandle(std::vector<uint8_t> value);

    static void allow(CiphertextHandle& handle, const PrincipalId& principal);

private:
    PrincipalId systemPrincipal_;
    std::atomic<HandleId> nextHandleId_{1};
};

} // namespace cipherledger::core
