#include "core/softwarecapability.hpp"
#include "core/errors.hpp"
#include "logging/logging.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

namespace cipherledger::core {

namespace {
constexpr size_t KEY_SIZE = 32;         // 256 bits
constexpr size_t TAG_SIZE = 16;         // 128 bits
constexpr size_t AES_GCM_IV_SIZE = 12;  // 96 bits
constexpr size_t RANDOM_KEY_SIZE = 32;  // token key material

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx newCipherCtx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }
    return ctx;
}
} // namespace

SoftwareCapability::SoftwareCapability(PrincipalId systemPrincipal)
    : EncryptionCapability(std::move(systemPrincipal)),
      masterKey_(KEY_SIZE),
      oracleKeys_(signatures_.generateKeyPair()) {
    if (!generateRandomBytes(masterKey_.data(), masterKey_.size())) {
        throw std::runtime_error("Failed to generate master key");
    }
}

SoftwareCapability::~SoftwareCapability() = default;

CiphertextHandle SoftwareCapability::encrypt(const Plaintext& rawValue) {
    return makeHandle(seal(rawValue));
}

CiphertextHandle SoftwareCapability::randomCiphertext() {
    SecureMemory::SecureVector<uint8_t> key(RANDOM_KEY_SIZE);
    if (!generateRandomBytes(key.data(), key.size())) {
        throw std::runtime_error("Failed to generate random key material");
    }
    Plaintext raw(key.data(), key.data() + key.size());
    auto handle = makeHandle(seal(raw));
    SecureMemory::wipe(raw.data(), raw.size());
    return handle;
}

RequestId SoftwareCapability::requestDecryption(
    const std::vector<CiphertextHandle>& handles,
    DecryptionCallback callback) {

    if (handles.empty()) {
        throw InvalidInput("decryption request needs at least one handle");
    }
    for (const auto& handle : handles) {
        if (handle.empty()) {
            throw InvalidInput("decryption request contains an empty handle");
        }
        if (!handle.isAllowed(systemPrincipal())) {
            throw NoAccess("system principal may not decrypt handle " +
                           std::to_string(handle.id()));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    RequestId id = nextRequestId_++;
    queue_.push_back(PendingRequest{id, handles, std::move(callback)});
    return id;
}

std::vector<uint8_t> SoftwareCapability::oracleVerificationKey() const {
    return oracleKeys_.publicKey;
}

Plaintext SoftwareCapability::decrypt(const CiphertextHandle& handle,
                                      const PrincipalId& requester) const {
    if (!handle.isAllowed(requester)) {
        throw NoAccess("principal '" + requester + "' may not decrypt handle " +
                       std::to_string(handle.id()));
    }
    return open(handle.value());
}

size_t SoftwareCapability::processPending() {
    size_t answered = 0;
    for (;;) {
        PendingRequest request;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                break;
            }
            request = std::move(queue_.front());
            queue_.pop_front();
        }

        std::vector<Plaintext> cleartexts;
        cleartexts.reserve(request.handles.size());
        for (const auto& handle : request.handles) {
            cleartexts.push_back(decrypt(handle, systemPrincipal()));
        }

        auto signature = signatures_.signDecryptionResponse(
            request.id, cleartexts, oracleKeys_.privateKey);
        if (signature.empty()) {
            throw std::runtime_error("Failed to sign decryption response");
        }

        CIPHERLEDGER_LOG_DEBUG("oracle answered decryption request",
                               {logging::UintField("request_id", request.id),
                                logging::UintField("handles", request.handles.size())});

        if (request.callback) {
            request.callback(request.id, std::move(cleartexts), std::move(signature));
        }
        ++answered;
    }
    return answered;
}

size_t SoftwareCapability::pendingRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool SoftwareCapability::generateRandomBytes(uint8_t* output, size_t length) {
    return RAND_bytes(output, static_cast<int>(length)) == 1;
}

std::vector<uint8_t> SoftwareCapability::seal(const Plaintext& data) const {
    std::vector<uint8_t> iv(AES_GCM_IV_SIZE);
    if (!generateRandomBytes(iv.data(), iv.size())) {
        throw std::runtime_error("Failed to generate IV");
    }

    auto ctx = newCipherCtx();
    if (!EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr,
                            masterKey_.data(), iv.data())) {
        throw std::runtime_error("Failed to initialize encryption");
    }

    std::vector<uint8_t> output(data.size() + EVP_MAX_BLOCK_LENGTH);
    int out_len = 0;
    int total_len = 0;

    if (!EVP_EncryptUpdate(ctx.get(), output.data(), &out_len,
                           data.data(), static_cast<int>(data.size()))) {
        throw std::runtime_error("Encryption failed");
    }
    total_len = out_len;

    if (!EVP_EncryptFinal_ex(ctx.get(), output.data() + total_len, &out_len)) {
        throw std::runtime_error("Encryption finalization failed");
    }
    total_len += out_len;

    std::vector<uint8_t> tag(TAG_SIZE);
    if (!EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                             static_cast<int>(TAG_SIZE), tag.data())) {
        throw std::runtime_error("Failed to read authentication tag");
    }

    std::vector<uint8_t> sealed;
    sealed.reserve(AES_GCM_IV_SIZE + static_cast<size_t>(total_len) + TAG_SIZE);
    sealed.insert(sealed.end(), iv.begin(), iv.end());
    sealed.insert(sealed.end(), output.begin(), output.begin() + total_len);
    sealed.insert(sealed.end(), tag.begin(), tag.end());
    return sealed;
}

Plaintext SoftwareCapability::open(const std::vector<uint8_t>& sealed) const {
    if (sealed.size() < AES_GCM_IV_SIZE + TAG_SIZE) {
        throw std::runtime_error("Ciphertext too short");
    }

    const uint8_t* iv = sealed.data();
    const uint8_t* body = sealed.data() + AES_GCM_IV_SIZE;
    const size_t body_len = sealed.size() - AES_GCM_IV_SIZE - TAG_SIZE;
    std::vector<uint8_t> tag(sealed.end() - static_cast<std::ptrdiff_t>(TAG_SIZE), sealed.end());

    auto ctx = newCipherCtx();
    if (!EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr,
                            masterKey_.data(), iv)) {
        throw std::runtime_error("Failed to initialize decryption");
    }

    Plaintext output(body_len + EVP_MAX_BLOCK_LENGTH);
    int out_len = 0;
    int total_len = 0;

    if (!EVP_DecryptUpdate(ctx.get(), output.data(), &out_len,
                           body, static_cast<int>(body_len))) {
        throw std::runtime_error("Decryption failed");
    }
    total_len = out_len;

    if (!EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                             static_cast<int>(TAG_SIZE), tag.data())) {
        throw std::runtime_error("Failed to set authentication tag");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + total_len, &out_len) <= 0) {
        throw std::runtime_error("Ciphertext authentication failed");
    }
    total_len += out_len;

    output.resize(static_cast<size_t>(total_len));
    return output;
}

} // namespace cipherledger::core
