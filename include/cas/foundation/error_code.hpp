#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the authentication core.

#include <cstdint>
#include <string_view>

namespace cas::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Storage (0x0100 - 0x01FF)
    StorageError = 0x0100,
    StorageConflict = 0x0101,

    // Crypto (0x0200 - 0x02FF)
    CryptoError = 0x0200,
    EncryptionFailed = 0x0201,
    DecryptionFailed = 0x0202,
    SigningFailed = 0x0203,
    SignatureInvalid = 0x0204,
    KeyMaterialInvalid = 0x0205,
    KeyGenerationFailed = 0x0206,
    UnsupportedAlgorithm = 0x0207,

    // Client registry (0x0300 - 0x03FF)
    ClientAlreadyExists = 0x0300,
    ClientNotFound = 0x0301,
    ClientSecretRequired = 0x0302,
    PublicClientSecretNotAllowed = 0x0303,
    InvalidClient = 0x0304,

    // Auth / tokens (0x0500 - 0x05FF)
    AuthenticationFailed = 0x0500,
    TokenExpired = 0x0501,
    InvalidToken = 0x0502,
    PermissionDenied = 0x0503,
    InvalidRequest = 0x0504,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Storage";
        case 0x0200: return "Crypto";
        case 0x0300: return "Client";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace cas::foundation
