#pragma once

#include "core/ciphertexthandle.hpp"
#include "core/clock.hpp"
#include "core/core_export.hpp"
#include "core/encryptioncapability.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cipherledger::registry {

struct ContentItem {
    ContentId id = 0;
    PrincipalId creator;
    core::CiphertextHandle payload;
    core::CiphertextHandle price;
    core::TimePoint createdAt;
    bool active = true;
    std::string title;
    std::string description;
};

/**
 * @brief Public metadata of a content item
 */
struct ContentSummary {
    PrincipalId creator;
    std::string title;
    std::string description;
    core::TimePoint createdAt;
    bool active = true;
};

/**
 * @brief Owner of every content item
 *
 * Items are created once and never removed; deactivation is a flag
 * only the creator may flip. Ids start at 1 and are never reused.
 */
class CIPHERLEDGER_CORE_EXPORT ContentRegistry {
public:
    explicit ContentRegistry(core::EncryptionCapability& capability);
    ~ContentRegistry();

    ContentRegistry(const ContentRegistry&) = delete;
    ContentRegistry& operator=(const ContentRegistry&) = delete;

    /**
     * @brief Encrypt and register a new content item
     * @param creator Owner of the item, granted decrypt on both handles
     * @param payload Raw payload bytes
     * @param price Raw price
     * @param title Non-empty title
     * @param description Non-empty description
     * @param now Creation time
     * @return Id of the new item
     * @throws InvalidInput on an unset creator or empty metadata
     */
    ContentId createContent(const PrincipalId& creator,
                            const core::Plaintext& payload,
                            uint64_t price,
                            const std::string& title,
                            const std::string& description,
                            core::TimePoint now);

    /**
     * @brief Flip the lifecycle flag
     * @return Previous value of the flag
     * @throws NotFound for an unknown id
     * @throws Unauthorized unless caller is the creator
     */
    bool setActive(ContentId id, const PrincipalId& caller, bool isActive);

    /**
     * @throws NotFound for an unknown id
     */
    ContentSummary getInfo(ContentId id) const;

    const ContentItem* find(ContentId id) const;

    /**
     * @throws NotFound for an unknown id
     */
    const ContentItem& get(ContentId id) const;

    /**
     * @throws NotFound for an unknown id
     * @throws Inactive if the item is deactivated
     */
    const ContentItem& requireActive(ContentId id) const;

    /**
     * @brief Ids created by a principal, in creation order
     */
    std::vector<ContentId> listByOwner(const PrincipalId& owner) const;

    uint64_t count() const { return items_.size(); }

    /**
     * @brief Swap in a payload handle with an extended allow-list
     * @throws NotFound for an unknown id
     */
    void replacePayload(ContentId id, core::CiphertextHandle payload);

    /**
     * @brief Undo the most recent createContent
     * @throws std::logic_error if id is not the most recent item
     */
    void discard(ContentId id);

private:
    core::EncryptionCapability& capability_;
    std::map<ContentId, ContentItem> items_;
    std::map<PrincipalId, std::vector<ContentId>> byOwner_;
    ContentId nextId_ = 1;

    ContentItem& mutableItem(ContentId id);
};

} // namespace cipherledger::registry
