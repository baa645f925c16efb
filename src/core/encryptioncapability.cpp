#include "core/encryptioncapability.hpp"
#include "core/errors.hpp"
#include <utility>

namespace cipherledger::core {

EncryptionCapability::EncryptionCapability(PrincipalId systemPrincipal)
    : systemPrincipal_(std::move(systemPrincipal)) {
    if (systemPrincipal_.empty()) {
        throw InvalidInput("system principal must not be empty");
    }
}

EncryptionCapability::~EncryptionCapability() = default;

CiphertextHandle EncryptionCapability::encryptUint64(uint64_t value) {
    return encrypt(encodeUint64(value));
}

void EncryptionCapability::grantDecrypt(CiphertextHandle& handle, const PrincipalId& principal) {
    if (principal.empty()) {
        throw InvalidInput("cannot grant decryption to the unset principal");
    }
    if (handle.empty()) {
        throw InvalidInput("cannot grant decryption on an empty handle");
    }
    allow(handle, principal);
}

std::vector<uint8_t> EncryptionCapability::oracleVerificationKey() const {
    return {};
}

Plaintext EncryptionCapability::encodeUint64(uint64_t value) {
    Plaintext out(8);
    for (int i = 7; i >= 0; --i) {
        out[static_cast<size_t>(i)] = static_cast<uint8_t>(value & 0xff);
        value >>= 8;
    }
    return out;
}

uint64_t EncryptionCapability::decodeUint64(const Plaintext& value) {
    if (value.size() != 8) {
        throw InvalidInput("encoded integer must be 8 bytes");
    }
    uint64_t out = 0;
    for (uint8_t byte : value) {
        out = (out << 8) | byte;
    }
    return out;
}

CiphertextHandle EncryptionCapability::makeHandle(std::vector<uint8_t> value) {
    CiphertextHandle handle(nextHandleId_++, std::move(value));
    allow(handle, systemPrincipal_);
    return handle;
}

void EncryptionCapability::allow(CiphertextHandle& handle, const PrincipalId& principal) {
    handle.allowed_.insert(principal);
}

} // namespace cipherledger::core
