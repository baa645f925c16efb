#include "config/configloader.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace cipherledger::config {

static void rejectUnknownKeys(const YAML::Node& node,
                              const std::string& section,
                              std::initializer_list<const char*> allowed) {
    if (!node.IsMap()) {
        throw std::runtime_error("Invalid configuration: '" + section + "' must be a mapping");
    }
    for (const auto& entry : node) {
        const auto key = entry.first.as<std::string>();
        bool known = false;
        for (const char* candidate : allowed) {
            if (key == candidate) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw std::runtime_error("Invalid configuration: unknown key '" +
                                     (section.empty() ? key : section + "." + key) + "'");
        }
    }
}

template <typename T>
static T scalar(const YAML::Node& node, const std::string& name) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid configuration: '" + name + "': " + e.what());
    }
}

static void loadLedger(const YAML::Node& node, LedgerSection& ledger) {
    rejectUnknownKeys(node, "ledger", {"system_principal", "max_access_duration"});

    if (node["system_principal"]) {
        ledger.systemPrincipal = scalar<std::string>(node["system_principal"], "ledger.system_principal");
        if (ledger.systemPrincipal.empty()) {
            throw std::runtime_error("Invalid configuration: 'ledger.system_principal' must not be empty");
        }
    }
    if (node["max_access_duration"]) {
        auto seconds = scalar<int64_t>(node["max_access_duration"], "ledger.max_access_duration");
        if (seconds < 0) {
            throw std::runtime_error("Invalid configuration: 'ledger.max_access_duration' must not be negative");
        }
        ledger.maxAccessDuration = std::chrono::seconds(seconds);
    }
}

static void loadAudit(const YAML::Node& node, AuditConfig& audit) {
    rejectUnknownKeys(node, "audit", {"database_path", "hmac_key_hex"});

    if (node["database_path"]) {
        audit.databasePath = scalar<std::string>(node["database_path"], "audit.database_path");
    }
    if (node["hmac_key_hex"]) {
        audit.hmacKey = ConfigLoader::decodeHex(scalar<std::string>(node["hmac_key_hex"], "audit.hmac_key_hex"));
    }
    if (audit.persistent() && audit.hmacKey.empty()) {
        throw std::runtime_error("Invalid configuration: 'audit.hmac_key_hex' is required when "
                                 "'audit.database_path' names a file");
    }
}

static void loadOracle(const YAML::Node& node, OracleConfig& oracle) {
    rejectUnknownKeys(node, "oracle", {"public_key_hex"});

    if (node["public_key_hex"]) {
        oracle.publicKey = ConfigLoader::decodeHex(scalar<std::string>(node["public_key_hex"], "oracle.public_key_hex"));
        if (!oracle.publicKey.empty() && oracle.publicKey.size() != 32) {
            throw std::runtime_error("Invalid configuration: 'oracle.public_key_hex' must encode 32 bytes");
        }
    }
}

static void loadLogging(const YAML::Node& node, LoggingConfig& logging) {
    rejectUnknownKeys(node, "logging", {"level", "pattern"});

    if (node["level"]) {
        logging.level = scalar<std::string>(node["level"], "logging.level");
    }
    if (node["pattern"]) {
        logging.pattern = scalar<std::string>(node["pattern"], "logging.pattern");
    }
}

static LedgerConfig fromNode(const YAML::Node& root) {
    LedgerConfig config;
    if (!root || root.IsNull()) {
        return config;
    }

    rejectUnknownKeys(root, "", {"ledger", "audit", "oracle", "logging"});

    if (root["ledger"]) loadLedger(root["ledger"], config.ledger);
    if (root["audit"]) loadAudit(root["audit"], config.audit);
    if (root["oracle"]) loadOracle(root["oracle"], config.oracle);
    if (root["logging"]) loadLogging(root["logging"], config.logging);

    return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

LedgerConfig ConfigLoader::loadFromYaml(const std::string& path) {
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
    }
    return fromNode(yaml);
}

LedgerConfig ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node node;
    try {
        node = YAML::Load(yaml);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
    }
    return fromNode(node);
}

std::vector<uint8_t> ConfigLoader::decodeHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::runtime_error("Invalid hex string: odd length");
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error("Invalid hex string: unexpected character");
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

} // namespace cipherledger::config
