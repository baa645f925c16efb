#include "cipherledger/ledger/contentledger.hpp"
#include "config/configloader.hpp"
#include "core/errors.hpp"
#include "core/softwarecapability.hpp"
#include "logging/logging.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace cipherledger;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--config <path>]\n"
              << "\n"
              << "Reads commands from stdin, one per line:\n"
              << "  create <creator> <title> <description> <payload> <price>\n"
              << "  purchase <buyer> <content-id> <seconds>\n"
              << "  access <user> <content-id>\n"
              << "  revoke <creator> <content-id> <user>\n"
              << "  activate|deactivate <creator> <content-id>\n"
              << "  check <content-id> <user>\n"
              << "  info <content-id>\n"
              << "  token <token-id>\n"
              << "  owned <principal>\n"
              << "  tokens <principal>\n"
              << "  decrypt <user> <content-id>\n"
              << "  events [json|csv]\n"
              << "  verify\n"
              << "  quit\n"
              << "Arguments containing spaces may be double-quoted.\n";
}

// Whitespace-separated words; "..." groups a word with spaces
std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool quoted = false;
    bool inWord = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            inWord = true;
        } else if (!quoted && (c == ' ' || c == '\t')) {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
        } else {
            current += c;
            inWord = true;
        }
    }
    if (quoted) {
        throw InvalidInput("unterminated quote");
    }
    if (inWord) {
        words.push_back(current);
    }
    return words;
}

uint64_t parseNumber(const std::string& text, const char* what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw InvalidInput(std::string(what) + " must be a non-negative integer: '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw InvalidInput(std::string(what) + " is out of range: '" + text + "'");
    }
}

int64_t parseSeconds(const std::string& text) {
    bool negative = !text.empty() && text[0] == '-';
    uint64_t magnitude = parseNumber(negative ? text.substr(1) : text, "duration");
    if (magnitude > static_cast<uint64_t>(INT64_MAX)) {
        throw InvalidInput("duration is out of range: '" + text + "'");
    }
    return negative ? -static_cast<int64_t>(magnitude) : static_cast<int64_t>(magnitude);
}

void requireArgs(const std::vector<std::string>& words, size_t count, const char* usage) {
    if (words.size() != count) {
        throw InvalidInput(std::string("usage: ") + usage);
    }
}

std::string joinIds(const std::vector<uint64_t>& ids) {
    std::ostringstream out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out << ' ';
        out << ids[i];
    }
    return out.str();
}

class CommandShell {
public:
    CommandShell(ledger::ContentLedger& ledger, core::SoftwareCapability& capability)
        : ledger_(ledger), capability_(capability) {}

    // Returns false once the session should end
    bool execute(const std::vector<std::string>& words) {
        const auto& cmd = words[0];

        if (cmd == "quit" || cmd == "exit") {
            return false;
        } else if (cmd == "create") {
            requireArgs(words, 6, "create <creator> <title> <description> <payload> <price>");
            core::Plaintext payload(words[4].begin(), words[4].end());
            auto id = ledger_.createContent(words[1], payload, parseNumber(words[5], "price"),
                                            words[2], words[3]);
            std::cout << "content " << id << "\n";
        } else if (cmd == "purchase") {
            requireArgs(words, 4, "purchase <buyer> <content-id> <seconds>");
            auto token = ledger_.purchaseAccess(words[1], parseNumber(words[2], "content id"),
                                                std::chrono::seconds(parseSeconds(words[3])));
            std::cout << "token " << token << "\n";
        } else if (cmd == "access") {
            requireArgs(words, 3, "access <user> <content-id>");
            auto handle = ledger_.accessContent(words[1], parseNumber(words[2], "content id"));
            std::cout << "handle " << handle.id() << "\n";
        } else if (cmd == "revoke") {
            requireArgs(words, 4, "revoke <creator> <content-id> <user>");
            ledger_.revokeAccess(words[1], parseNumber(words[2], "content id"), words[3]);
            std::cout << "ok\n";
        } else if (cmd == "activate" || cmd == "deactivate") {
            requireArgs(words, 3, "activate|deactivate <creator> <content-id>");
            ledger_.setActive(parseNumber(words[2], "content id"), words[1], cmd == "activate");
            std::cout << "ok\n";
        } else if (cmd == "check") {
            requireArgs(words, 3, "check <content-id> <user>");
            bool allowed = ledger_.checkAccess(parseNumber(words[1], "content id"), words[2]);
            std::cout << (allowed ? "true" : "false") << "\n";
        } else if (cmd == "info") {
            requireArgs(words, 2, "info <content-id>");
            auto id = parseNumber(words[1], "content id");
            auto info = ledger_.getInfo(id);
            std::cout << "content " << id
                      << " creator=" << info.creator
                      << " title=\"" << info.title << "\""
                      << " description=\"" << info.description << "\""
                      << " created=" << core::toUnixSeconds(info.createdAt)
                      << " active=" << (info.active ? "true" : "false") << "\n";
        } else if (cmd == "token") {
            requireArgs(words, 2, "token <token-id>");
            auto id = parseNumber(words[1], "token id");
            auto info = ledger_.getTokenInfo(id);
            std::cout << "token " << id
                      << " content=" << info.contentId
                      << " owner=" << info.owner
                      << " expires=" << core::toUnixSeconds(info.expiresAt)
                      << " valid=" << (info.valid ? "true" : "false") << "\n";
        } else if (cmd == "owned") {
            requireArgs(words, 2, "owned <principal>");
            std::cout << joinIds(ledger_.listContentByOwner(words[1])) << "\n";
        } else if (cmd == "tokens") {
            requireArgs(words, 2, "tokens <principal>");
            std::cout << joinIds(ledger_.listTokensByOwner(words[1])) << "\n";
        } else if (cmd == "decrypt") {
            requireArgs(words, 3, "decrypt <user> <content-id>");
            decrypt(words[1], parseNumber(words[2], "content id"));
        } else if (cmd == "events") {
            if (words.size() > 2) {
                throw InvalidInput("usage: events [json|csv]");
            }
            auto format = audit::Format::JSON;
            if (words.size() == 2) {
                if (words[1] == "csv") {
                    format = audit::Format::CSV;
                } else if (words[1] != "json") {
                    throw InvalidInput("unknown export format '" + words[1] + "'");
                }
            }
            std::cout << ledger_.auditLog().exportEvents(format).content << "\n";
        } else if (cmd == "verify") {
            std::cout << (ledger_.auditLog().verifyIntegrity() ? "integrity ok" : "integrity FAILED") << "\n";
        } else if (cmd == "help") {
            printUsage("cipherledger");
        } else {
            throw InvalidInput("unknown command '" + cmd + "'");
        }
        return true;
    }

private:
    ledger::ContentLedger& ledger_;
    core::SoftwareCapability& capability_;

    void decrypt(const PrincipalId& user, ContentId contentId) {
        bool delivered = false;
        auto requestId = ledger_.requestContentDecryption(
            user, contentId, [&delivered](const oracle::DecryptionResult& result) {
                delivered = true;
                for (const auto& cleartext : result.cleartexts) {
                    std::cout << "decrypted " << result.requestId << ": "
                              << std::string(cleartext.begin(), cleartext.end()) << "\n";
                }
            });

        // The software oracle answers queued requests synchronously here
        capability_.processPending();
        if (!delivered) {
            std::cout << "request " << requestId << " not fulfilled\n";
        }
    }
};

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    config::LedgerConfig cfg;
    try {
        if (!configPath.empty()) {
            cfg = config::ConfigLoader::loadFromYaml(configPath);
        }
        logging::InitializeLogging(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "cipherledger: " << e.what() << "\n";
        return 1;
    }

    int status = 0;
    try {
        auto capability = std::make_shared<core::SoftwareCapability>(cfg.ledger.systemPrincipal);
        ledger::ContentLedger ledger(cfg, capability);
        CommandShell shell(ledger, *capability);

        std::string line;
        while (std::getline(std::cin, line)) {
            try {
                auto words = tokenize(line);
                if (words.empty() || words[0][0] == '#') {
                    continue;
                }
                if (!shell.execute(words)) {
                    break;
                }
            } catch (const LedgerError& e) {
                std::cout << "error: " << errorCodeName(e.code()) << ": " << e.what() << "\n";
            } catch (const std::runtime_error& e) {
                CIPHERLEDGER_LOG_ERROR("command failed", {logging::StringField("error", e.what())});
                std::cout << "error: Internal: " << e.what() << "\n";
            }
        }
    } catch (const std::exception& e) {
        CIPHERLEDGER_LOG_ERROR("fatal error", {logging::StringField("error", e.what())});
        std::cerr << "cipherledger: " << e.what() << "\n";
        status = 1;
    }

    logging::ShutdownLogging();
    return status;
}
