#pragma once

#include "core/core_export.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <set>
#include <vector>

namespace cipherledger::core {

class EncryptionCapability;

/**
 * @brief Opaque reference to an encrypted value and its decrypt allow-list
 *
 * A handle is a capability, not a value: callers can copy and pass it
 * around, but only an EncryptionCapability can mint one or add a
 * principal to its allow-list. A principal may request decryption only
 * if isAllowed() holds for it.
 */
class CIPHERLEDGER_CORE_EXPORT CiphertextHandle {
public:
    /**
     * @brief Empty handle referring to nothing
     */
    CiphertextHandle() = default;

    HandleId id() const { return id_; }
    bool empty() const { return id_ == 0; }

    /**
     * @brief Opaque ciphertext bytes, meaningful only to the issuing capability
     */
    const std::vector<uint8_t>& value() const { return value_; }

    const std::set<PrincipalId>& allowedPrincipals() const { return allowed_; }

    bool isAllowed(const PrincipalId& principal) const;

    bool operator==(const CiphertextHandle& other) const;
    bool operator!=(const CiphertextHandle& other) const { return !(*this == other); }

private:
    friend class EncryptionCapability;

    CiphertextHandle(HandleId id, std::vector<uint8_t> value);

    HandleId id_ = 0;
    std::vector<uint8_t> value_;
    std::set<PrincipalId> allowed_;
};

} // namespace cipherledger::core
