#include "oracle/decryptiongateway.hpp"
#include "core/errors.hpp"
#include "logging/logging.hpp"
#include <utility>

namespace cipherledger::oracle {

namespace {
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
}

DecryptionGateway::DecryptionGateway(core::EncryptionCapability& capability,
                                     std::vector<uint8_t> oraclePublicKey,
                                     core::DecryptionCallback responseSink)
    : capability_(capability),
      oraclePublicKey_(std::move(oraclePublicKey)),
      responseSink_(std::move(responseSink)) {
    if (oraclePublicKey_.size() != ED25519_PUBLIC_KEY_SIZE) {
        throw InvalidInput("oracle public key must be a 32-byte Ed25519 key");
    }
}

DecryptionGateway::~DecryptionGateway() = default;

RequestId DecryptionGateway::submit(ContentId contentId,
                                    const PrincipalId& requester,
                                    const core::CiphertextHandle& payload,
                                    DecryptionHandler handler) {
    RequestId id = capability_.requestDecryption({payload}, responseSink_);
    if (pending_.count(id) != 0) {
        throw std::runtime_error("capability reused decryption request id " +
                                 std::to_string(id));
    }
    pending_.emplace(id, PendingDecryption{id, contentId, requester, std::move(handler)});
    return id;
}

PendingDecryption DecryptionGateway::complete(RequestId requestId,
                                              const std::vector<core::Plaintext>& cleartexts,
                                              const std::vector<uint8_t>& signature) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw NotFound("no pending decryption request " + std::to_string(requestId));
    }

    if (!signatures_.verifyDecryptionResponse(requestId, cleartexts, signature,
                                              oraclePublicKey_)) {
        CIPHERLEDGER_LOG_WARN("rejected decryption response with invalid signature",
                              {logging::UintField("request_id", requestId)});
        throw VerificationFailed("oracle signature on request " +
                                 std::to_string(requestId) + " does not verify");
    }

    PendingDecryption request = std::move(it->second);
    pending_.erase(it);
    return request;
}

PendingDecryption DecryptionGateway::cancel(RequestId requestId) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw NotFound("no pending decryption request " + std::to_string(requestId));
    }
    PendingDecryption request = std::move(it->second);
    pending_.erase(it);
    return request;
}

void DecryptionGateway::restore(PendingDecryption request) {
    RequestId id = request.requestId;
    pending_[id] = std::move(request);
}

} // namespace cipherledger::oracle
