#include "core/ciphertexthandle.hpp"
#include <utility>

namespace cipherledger::core {

CiphertextHandle::CiphertextHandle(HandleId id, std::vector<uint8_t> value)
    : id_(id), value_(std::move(value)) {}

bool CiphertextHandle::isAllowed(const PrincipalId& principal) const {
    if (principal.empty()) {
        return false;
    }
    return allowed_.find(principal) != allowed_.end();
}

bool CiphertextHandle::operator==(const CiphertextHandle& other) const {
    return id_ == other.id_ && value_ == other.value_ && allowed_ == other.allowed_;
}

} // namespace cipherledger::core
