#pragma once

#include "config/ledgerconfig.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cipherledger::config {

/*
  Loads LedgerConfig from YAML.

  Every field is optional; unknown sections or keys are rejected with
  std::runtime_error so typos do not silently fall back to defaults.
*/
class ConfigLoader {
public:
    static LedgerConfig loadFromYaml(const std::string& path);
    static LedgerConfig loadFromString(const std::string& yaml);

    /**
     * @brief Decode a hex string, upper or lower case
     * @throws std::runtime_error on odd length or a non-hex digit
     */
    static std::vector<uint8_t> decodeHex(const std::string& hex);
};

} // namespace cipherledger::config
