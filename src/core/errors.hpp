#pragma once

#include <stdexcept>
#include <string>

namespace cipherledger {

/*
  Error kinds raised by ledger operations.

  Every operation throws synchronously to its caller and leaves no
  partially applied state behind.
*/

enum class ErrorCode {
    InvalidInput,
    NotFound,
    Inactive,
    AlreadyGranted,
    NoAccess,
    Unauthorized,
    VerificationFailed
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Inactive: return "Inactive";
        case ErrorCode::AlreadyGranted: return "AlreadyGranted";
        case ErrorCode::NoAccess: return "NoAccess";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::VerificationFailed: return "VerificationFailed";
    }
    return "Unknown";
}

class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class InvalidInput : public LedgerError {
public:
    explicit InvalidInput(const std::string& msg)
        : LedgerError(ErrorCode::InvalidInput, msg) {}
};

class NotFound : public LedgerError {
public:
    explicit NotFound(const std::string& msg)
        : LedgerError(ErrorCode::NotFound, msg) {}
};

class Inactive : public LedgerError {
public:
    explicit Inactive(const std::string& msg)
        : LedgerError(ErrorCode::Inactive, msg) {}
};

class AlreadyGranted : public LedgerError {
public:
    explicit AlreadyGranted(const std::string& msg)
        : LedgerError(ErrorCode::AlreadyGranted, msg) {}
};

class NoAccess : public LedgerError {
public:
    explicit NoAccess(const std::string& msg)
        : LedgerError(ErrorCode::NoAccess, msg) {}
};

class Unauthorized : public LedgerError {
public:
    explicit Unauthorized(const std::string& msg)
        : LedgerError(ErrorCode::Unauthorized, msg) {}
};

class VerificationFailed : public LedgerError {
public:
    explicit VerificationFailed(const std::string& msg)
        : LedgerError(ErrorCode::VerificationFailed, msg) {}
};

} // namespace cipherledger
