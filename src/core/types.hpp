#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cipherledger {

/**
 * @brief Identity of a user or of the ledger itself
 *
 * The empty string is the unset principal and is never a valid
 * caller, creator or grantee.
 */
using PrincipalId = std::string;

using ContentId = uint64_t;
using TokenId = uint64_t;
using RequestId = uint64_t;
using HandleId = uint64_t;

namespace core {

/**
 * @brief Raw value before encryption or after an authorized decryption
 */
using Plaintext = std::vector<uint8_t>;

} // namespace core

} // namespace cipherledger
