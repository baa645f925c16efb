#pragma once

#include "config/ledgerconfig.hpp"
#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cipherledger::logging {

struct LogField {
    std::string key;
    std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

/**
 * @brief Install the "cipherledger" logger as spdlog's default
 *
 * CIPHERLEDGER_LOG_LEVEL and CIPHERLEDGER_LOG_PATTERN override the
 * configured values. Safe to call more than once.
 */
void InitializeLogging(const config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::err, message, fields);
}

} // namespace cipherledger::logging

#define CIPHERLEDGER_LOG_DEBUG(message, ...) ::cipherledger::logging::LogDebug((message), ##__VA_ARGS__)
#define CIPHERLEDGER_LOG_INFO(message, ...) ::cipherledger::logging::LogInfo((message), ##__VA_ARGS__)
#define CIPHERLEDGER_LOG_WARN(message, ...) ::cipherledger::logging::LogWarn((message), ##__VA_ARGS__)
#define CIPHERLEDGER_LOG_ERROR(message, ...) ::cipherledger::logging::LogError((message), ##__VA_ARGS__)
