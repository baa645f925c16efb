#include "access/tokenstore.hpp"
#include "core/errors.hpp"
#include <stdexcept>
#include <utility>

namespace cipherledger::access {

TokenStore::TokenStore(core::EncryptionCapability& capability)
    : capability_(capability) {}

TokenStore::~TokenStore() = default;

const AccessToken& TokenStore::mint(ContentId contentId,
                                    const PrincipalId& owner,
                                    std::chrono::seconds duration,
                                    core::TimePoint now) {
    if (owner.empty()) {
        throw InvalidInput("token owner must be set");
    }
    if (duration.count() <= 0) {
        throw InvalidInput("token duration must be positive");
    }
    auto expiresAt = core::addSeconds(now, duration);
    if (!expiresAt) {
        throw InvalidInput("token expiry overflows the clock");
    }

    AccessToken token;
    token.id = tokens_.size() + 1;
    token.contentId = contentId;
    token.owner = owner;
    token.expiresAt = *expiresAt;
    token.valid = true;
    token.accessKey = capability_.randomCiphertext();
    capability_.grantDecrypt(token.accessKey, owner);

    tokens_.push_back(std::move(token));
    try {
        byOwner_[owner].push_back(tokens_.back().id);
    } catch (...) {
        tokens_.pop_back();
        throw;
    }
    return tokens_.back();
}

bool TokenStore::invalidate(TokenId id) {
    auto& token = mutableToken(id);
    bool previous = token.valid;
    token.valid = false;
    return previous;
}

bool TokenStore::isUsable(TokenId id, core::TimePoint now) const {
    const auto* token = find(id);
    return token && token->valid && token->expiresAt > now;
}

const AccessToken* TokenStore::find(TokenId id) const {
    if (id == 0 || id > tokens_.size()) {
        return nullptr;
    }
    return &tokens_[id - 1];
}

const AccessToken& TokenStore::get(TokenId id) const {
    const auto* token = find(id);
    if (!token) {
        throw NotFound("token " + std::to_string(id) + " does not exist");
    }
    return *token;
}

TokenSummary TokenStore::info(TokenId id) const {
    const auto& token = get(id);
    return TokenSummary{token.contentId, token.owner, token.expiresAt, token.valid};
}

std::vector<TokenId> TokenStore::listByOwner(const PrincipalId& owner) const {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) {
        return {};
    }
    return it->second;
}

void TokenStore::discard(TokenId id) {
    if (tokens_.empty() || id != tokens_.size()) {
        throw std::logic_error("only the most recent token can be discarded");
    }

    auto owner = byOwner_.find(tokens_.back().owner);
    if (owner != byOwner_.end()) {
        owner->second.pop_back();
        if (owner->second.empty()) {
            byOwner_.erase(owner);
        }
    }
    tokens_.pop_back();
}

void TokenStore::reinstate(TokenId id, bool valid) {
    mutableToken(id).valid = valid;
}

AccessToken& TokenStore::mutableToken(TokenId id) {
    if (id == 0 || id > tokens_.size()) {
        throw NotFound("token " + std::to_string(id) + " does not exist");
    }
    return tokens_[id - 1];
}

} // namespace cipherledger::access
