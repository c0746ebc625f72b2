#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace motorid {

    // ===========================================
    // Error kinds
    // ===========================================

    /// Every motorid error code falls in one kind range (code / 100)
    enum class ErrorKind : dp::u8 {
        Unknown = 0,
        Validation = 1,
        Authorization = 2,
        NotFound = 3,
        Conflict = 4,
        Storage = 5,
    };

    // ===========================================
    // Reason codes
    // ===========================================

    // Validation (100-199)
    constexpr dp::u32 ERR_EMPTY_FIELD = 100;
    constexpr dp::u32 ERR_NULL_ADDRESS = 101;
    constexpr dp::u32 ERR_INVALID_ROLE = 102;
    constexpr dp::u32 ERR_UNREGISTERED_OWNER = 103;
    constexpr dp::u32 ERR_UNKNOWN_VEHICLE = 104;
    constexpr dp::u32 ERR_INVALID_PERIOD = 105;
    constexpr dp::u32 ERR_INVALID_DID = 106;
    constexpr dp::u32 ERR_UNRESOLVED_IDENTIFIER = 107;
    constexpr dp::u32 ERR_DOCUMENT_REVOKED = 108;
    constexpr dp::u32 ERR_NO_OWNER = 109;
    constexpr dp::u32 ERR_INVALID_OPERATION = 110;
    constexpr dp::u32 ERR_REENTRANT_SUBMIT = 111;

    // Authorization (200-299)
    constexpr dp::u32 ERR_NOT_REGISTERED = 200;
    constexpr dp::u32 ERR_ROLE_REQUIRED = 201;
    constexpr dp::u32 ERR_NOT_VEHICLE_OWNER = 202;
    constexpr dp::u32 ERR_MECHANIC_NOT_AUTHORIZED = 203;
    constexpr dp::u32 ERR_NOT_CONTROLLER = 204;

    // Not found (300-399)
    constexpr dp::u32 ERR_DID_NOT_FOUND = 300;
    constexpr dp::u32 ERR_VEHICLE_NOT_FOUND = 301;
    constexpr dp::u32 ERR_PRINCIPAL_NOT_FOUND = 302;
    constexpr dp::u32 ERR_CREDENTIAL_NOT_FOUND = 303;
    constexpr dp::u32 ERR_DOCUMENT_NOT_FOUND = 304;
    constexpr dp::u32 ERR_POLICY_NOT_FOUND = 305;
    constexpr dp::u32 ERR_UNIT_NOT_FOUND = 306;

    // Conflict (400-499)
    constexpr dp::u32 ERR_ALREADY_REGISTERED = 400;
    constexpr dp::u32 ERR_DUPLICATE_VIN = 401;
    constexpr dp::u32 ERR_DUPLICATE_CREDENTIAL = 402;
    constexpr dp::u32 ERR_DID_ALREADY_BOUND = 403;

    // Storage (500-599)
    constexpr dp::u32 ERR_STORAGE_IO = 500;
    constexpr dp::u32 ERR_JOURNAL_CORRUPT = 501;
    constexpr dp::u32 ERR_STORE_NOT_OPEN = 502;

    /// Classify an error by its code range
    inline ErrorKind errorKind(dp::u32 code) {
        switch (code / 100) {
        case 1:
            return ErrorKind::Validation;
        case 2:
            return ErrorKind::Authorization;
        case 3:
            return ErrorKind::NotFound;
        case 4:
            return ErrorKind::Conflict;
        case 5:
            return ErrorKind::Storage;
        default:
            return ErrorKind::Unknown;
        }
    }

    inline ErrorKind errorKind(const dp::Error &error) { return errorKind(error.code); }

    inline std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::Validation:
            return "ValidationError";
        case ErrorKind::Authorization:
            return "AuthorizationError";
        case ErrorKind::NotFound:
            return "NotFoundError";
        case ErrorKind::Conflict:
            return "ConflictError";
        case ErrorKind::Storage:
            return "StorageError";
        default:
            return "UnknownError";
        }
    }

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error validation_error(dp::u32 code, const std::string &msg) {
        return dp::Error{code, dp::String(msg.c_str())};
    }

    inline dp::Error authorization_error(dp::u32 code, const std::string &msg) {
        return dp::Error{code, dp::String(msg.c_str())};
    }

    inline dp::Error not_found_error(dp::u32 code, const std::string &msg) {
        return dp::Error{code, dp::String(msg.c_str())};
    }

    inline dp::Error conflict_error(dp::u32 code, const std::string &msg) {
        return dp::Error{code, dp::String(msg.c_str())};
    }

    inline dp::Error storage_error(const std::string &msg = "Journal I/O failed") {
        return dp::Error{ERR_STORAGE_IO, dp::String(msg.c_str())};
    }

    inline dp::Error journal_corrupt(const std::string &msg = "Journal is corrupt") {
        return dp::Error{ERR_JOURNAL_CORRUPT, dp::String(msg.c_str())};
    }

    inline dp::Error store_not_open(const std::string &msg = "Store not open") {
        return dp::Error{ERR_STORE_NOT_OPEN, dp::String(msg.c_str())};
    }

    /// Render "<Kind>(<code>): <message>"
    inline std::string describeError(const dp::Error &error) {
        return errorKindToString(errorKind(error)) + "(" + std::to_string(error.code) +
               "): " + std::string(error.message.c_str());
    }

} // namespace motorid
