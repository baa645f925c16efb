#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cipherledger::config {

struct LedgerSection {
    // Principal auto-included on every handle the ledger creates
    std::string systemPrincipal = "cipherledger";
    // Longest purchasable access window, zero for unlimited
    std::chrono::seconds maxAccessDuration{0};
};

struct AuditConfig {
    std::string databasePath = ":memory:";
    // HMAC-SHA256 key chaining the event stream; random when empty, which
    // is only allowed for a store that does not outlive the process
    std::vector<uint8_t> hmacKey;

    bool persistent() const { return !databasePath.empty() && databasePath != ":memory:"; }
};

struct OracleConfig {
    // Ed25519 key decryption responses must verify under; when empty the
    // capability's own oracle key is used
    std::vector<uint8_t> publicKey;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
};

struct LedgerConfig {
    LedgerSection ledger;
    AuditConfig audit;
    OracleConfig oracle;
    LoggingConfig logging;
};

} // namespace cipherledger::config
