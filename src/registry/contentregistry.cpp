#include "registry/contentregistry.hpp"
#include "core/errors.hpp"
#include <stdexcept>
#include <utility>

namespace cipherledger::registry {

ContentRegistry::ContentRegistry(core::EncryptionCapability& capability)
    : capability_(capability) {}

ContentRegistry::~ContentRegistry() = default;

ContentId ContentRegistry::createContent(const PrincipalId& creator,
                                         const core::Plaintext& payload,
                                         uint64_t price,
                                         const std::string& title,
                                         const std::string& description,
                                         core::TimePoint now) {
    if (creator.empty()) {
        throw InvalidInput("creator must be set");
    }
    if (title.empty()) {
        throw InvalidInput("title must not be empty");
    }
    if (description.empty()) {
        throw InvalidInput("description must not be empty");
    }

    ContentItem item;
    item.creator = creator;
    item.payload = capability_.encrypt(payload);
    item.price = capability_.encryptUint64(price);
    capability_.grantDecrypt(item.payload, creator);
    capability_.grantDecrypt(item.price, creator);
    item.createdAt = now;
    item.active = true;
    item.title = title;
    item.description = description;

    // Nothing below throws except allocation
    item.id = nextId_;
    ContentId id = item.id;
    items_.emplace(id, std::move(item));
    byOwner_[creator].push_back(id);
    ++nextId_;
    return id;
}

bool ContentRegistry::setActive(ContentId id, const PrincipalId& caller, bool isActive) {
    auto& item = mutableItem(id);
    if (caller.empty() || caller != item.creator) {
        throw Unauthorized("only the creator may change the status of content " +
                           std::to_string(id));
    }
    bool previous = item.active;
    item.active = isActive;
    return previous;
}

ContentSummary ContentRegistry::getInfo(ContentId id) const {
    const auto& item = get(id);
    return ContentSummary{item.creator, item.title, item.description,
                          item.createdAt, item.active};
}

const ContentItem* ContentRegistry::find(ContentId id) const {
    auto it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second;
}

const ContentItem& ContentRegistry::get(ContentId id) const {
    const auto* item = find(id);
    if (!item) {
        throw NotFound("content " + std::to_string(id) + " does not exist");
    }
    return *item;
}

const ContentItem& ContentRegistry::requireActive(ContentId id) const {
    const auto& item = get(id);
    if (!item.active) {
        throw Inactive("content " + std::to_string(id) + " is deactivated");
    }
    return item;
}

std::vector<ContentId> ContentRegistry::listByOwner(const PrincipalId& owner) const {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) {
        return {};
    }
    return it->second;
}

void ContentRegistry::replacePayload(ContentId id, core::CiphertextHandle payload) {
    mutableItem(id).payload = std::move(payload);
}

void ContentRegistry::discard(ContentId id) {
    if (id == 0 || id + 1 != nextId_) {
        throw std::logic_error("only the most recent content item can be discarded");
    }
    auto it = items_.find(id);
    if (it == items_.end()) {
        throw std::logic_error("content to discard is missing");
    }

    auto owner = byOwner_.find(it->second.creator);
    if (owner != byOwner_.end()) {
        owner->second.pop_back();
        if (owner->second.empty()) {
            byOwner_.erase(owner);
        }
    }
    items_.erase(it);
    --nextId_;
}

ContentItem& ContentRegistry::mutableItem(ContentId id) {
    auto it = items_.find(id);
    if (it == items_.end()) {
        throw NotFound("content " + std::to_string(id) + " does not exist");
    }
    return it->second;
}

} // namespace cipherledger::registry
