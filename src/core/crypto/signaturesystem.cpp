#include "core/crypto/signaturesystem.hpp"
#include <openssl/err.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

std::string getOpenSSLError() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return buf;
}

void appendUint(std::vector<uint8_t>& out, uint64_t value, int width) {
    for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xff));
    }
}

} // anonymous namespace

namespace cipherledger::core {

SignatureSystem::SignatureSystem() : ctx_(nullptr) {
    ctx_ = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!ctx_) {
        throw std::runtime_error("Failed to create EdDSA context: " + getOpenSSLError());
    }
}

SignatureSystem::~SignatureSystem() {
    if (ctx_) {
        EVP_PKEY_CTX_free(ctx_);
    }
}

SignatureSystem::KeyPair SignatureSystem::generateKeyPair() {
    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(ctx_) <= 0 ||
        EVP_PKEY_keygen(ctx_, &pkey) <= 0) {
        throw std::runtime_error("Failed to generate key pair: " + getOpenSSLError());
    }

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> keyGuard(pkey, EVP_PKEY_free);

    size_t privLen = ED25519_PRIVATE_KEY_SIZE;
    SecureMemory::SecureVector<uint8_t> privateKey(privLen);
    if (EVP_PKEY_get_raw_private_key(pkey, privateKey.data(), &privLen) <= 0) {
        throw std::runtime_error("Failed to extract private key: " + getOpenSSLError());
    }

    size_t pubLen = ED25519_PUBLIC_KEY_SIZE;
    std::vector<uint8_t> publicKey(pubLen);
    if (EVP_PKEY_get_raw_public_key(pkey, publicKey.data(), &pubLen) <= 0) {
        throw std::runtime_error("Failed to extract public key: " + getOpenSSLError());
    }

    return KeyPair{std::move(privateKey), std::move(publicKey)};
}

std::vector<uint8_t> SignatureSystem::sign(
    const std::vector<uint8_t>& data,
    const SecureMemory::SecureVector<uint8_t>& privateKey) const {

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr,
        privateKey.data(), privateKey.size());
    if (!pkey) {
        return {};
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> keyGuard(pkey, EVP_PKEY_free);

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        return {};
    }
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>
        ctxGuard(mdctx, EVP_MD_CTX_free);

    if (EVP_DigestSignInit(mdctx, nullptr, nullptr, nullptr, pkey) <= 0) {
        return {};
    }

    size_t sigLen = ED25519_SIGNATURE_SIZE;
    std::vector<uint8_t> signature(sigLen);

    if (EVP_DigestSign(mdctx,
                       signature.data(), &sigLen,
                       data.data(), data.size()) <= 0) {
        return {};
    }

    signature.resize(sigLen);
    return signature;
}

bool SignatureSystem::verify(
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& publicKey) const {

    if (publicKey.size() != ED25519_PUBLIC_KEY_SIZE ||
        signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr,
        publicKey.data(), publicKey.size());
    if (!pkey) {
        return false;
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> keyGuard(pkey, EVP_PKEY_free);

    return verifySignature(data, signature, pkey);
}

std::vector<uint8_t> SignatureSystem::encodeDecryptionResponse(
    RequestId requestId,
    const std::vector<Plaintext>& cleartexts) {

    std::vector<uint8_t> out;
    appendUint(out, requestId, 8);
    appendUint(out, cleartexts.size(), 4);
    for (const auto& cleartext : cleartexts) {
        appendUint(out, cleartext.size(), 4);
        out.insert(out.end(), cleartext.begin(), cleartext.end());
    }
    return out;
}

std::vector<uint8_t> SignatureSystem::signDecryptionResponse(
    RequestId requestId,
    const std::vector<Plaintext>& cleartexts,
    const SecureMemory::SecureVector<uint8_t>& privateKey) const {
    return sign(encodeDecryptionResponse(requestId, cleartexts), privateKey);
}

bool SignatureSystem::verifyDecryptionResponse(
    RequestId requestId,
    const std::vector<Plaintext>& cleartexts,
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& publicKey) const {
    return verify(encodeDecryptionResponse(requestId, cleartexts), signature, publicKey);
}

bool SignatureSystem::verifySignature(
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& signature,
    EVP_PKEY* key) const {

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        return false;
    }
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>
        ctxGuard(mdctx, EVP_MD_CTX_free);

    if (EVP_DigestVerifyInit(mdctx, nullptr, nullptr, nullptr, key) <= 0) {
        return false;
    }

    return EVP_DigestVerify(mdctx,
                            signature.data(), signature.size(),
                            data.data(), data.size()) == 1;
}

} // namespace cipherledger::core
