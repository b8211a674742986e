#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic helpers: SHA-256, secure random,
///        base64/base64url, hex, constant-time comparison, UUIDs.
///
/// Digest and randomness come from OpenSSL (libcrypto). Used internally by
/// the secret hasher, the sealed-token codec and the token services.

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace cas::service::detail {

// =============================================================================
// SHA-256
// =============================================================================

/// Compute SHA-256 digest of the input data.
/// Returns 32-byte raw digest.
[[nodiscard]] inline std::array<uint8_t, 32> sha256(const uint8_t* data, std::size_t length) {
    std::array<uint8_t, 32> digest{};
    unsigned int digestLen = 0;
    EVP_Digest(data, length, digest.data(), &digestLen, EVP_sha256(), nullptr);
    return digest;
}

/// SHA-256 overload for string_view input.
[[nodiscard]] inline std::array<uint8_t, 32> sha256(std::string_view input) {
    return sha256(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

// =============================================================================
// Base64 / Base64URL (RFC 4648 sections 4 and 5)
// =============================================================================

namespace base64_tables {
inline constexpr char kStandard[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
inline constexpr char kUrl[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
}  // namespace base64_tables

/// Encode bytes with the given alphabet, optionally '=' padded.
[[nodiscard]] inline std::string base64EncodeWith(const char* table,
                                                  const uint8_t* data,
                                                  std::size_t length,
                                                  bool pad) {
    std::string result;
    result.reserve(((length + 2) / 3) * 4);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        } else if (pad) {
            result.push_back('=');
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        } else if (pad) {
            result.push_back('=');
        }
    }
    return result;
}

/// Encode bytes to base64url (no padding).
[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    return base64EncodeWith(base64_tables::kUrl, data, length, false);
}

/// Encode a string to base64url (no padding).
[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Encode bytes to standard padded base64.
[[nodiscard]] inline std::string base64Encode(const uint8_t* data, std::size_t length) {
    return base64EncodeWith(base64_tables::kStandard, data, length, true);
}

/// Encode a string to standard padded base64.
[[nodiscard]] inline std::string base64Encode(std::string_view input) {
    return base64Encode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Decode either base64 alphabet, padded or not.
///
/// Whitespace is skipped. Returns nullopt on any other invalid character or
/// on a dangling 6-bit group.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> base64DecodeAny(std::string_view input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-' || c == '+') {
            return 62;
        }
        if (c == '_' || c == '/') {
            return 63;
        }
        return -1;
    };

    std::vector<uint8_t> result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    std::size_t symbols = 0;
    bool padding = false;
    for (char c : input) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            continue;
        }
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) {
            return std::nullopt;
        }
        int val = decodeChar(c);
        if (val < 0) {
            return std::nullopt;
        }
        ++symbols;
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    if (symbols % 4 == 1) {
        return std::nullopt;
    }
    return result;
}

/// Decode unpadded base64url in its one canonical spelling.
///
/// Only `[A-Za-z0-9_-]` is accepted: no padding, no whitespace, no standard
/// alphabet. A dangling 6-bit group or non-zero trailing bits are rejected,
/// so each byte string has exactly one accepted encoding.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> base64urlDecodeStrict(
    std::string_view input) {
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val;
        if (c >= 'A' && c <= 'Z') {
            val = c - 'A';
        } else if (c >= 'a' && c <= 'z') {
            val = c - 'a' + 26;
        } else if (c >= '0' && c <= '9') {
            val = c - '0' + 52;
        } else if (c == '-') {
            val = 62;
        } else if (c == '_') {
            val = 63;
        } else {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    if (bits > 0 && (buf & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return result;
}

/// Decode base64url to bytes. Returns empty vector on invalid input.
[[nodiscard]] inline std::vector<uint8_t> base64urlDecode(std::string_view input) {
    auto decoded = base64DecodeAny(input);
    return decoded ? std::move(*decoded) : std::vector<uint8_t>{};
}

/// Decode base64url to string. Returns empty string on invalid input.
[[nodiscard]] inline std::string base64urlDecodeString(std::string_view input) {
    auto bytes = base64urlDecode(input);
    return {bytes.begin(), bytes.end()};
}

// =============================================================================
// Hex encoding
// =============================================================================

/// Encode bytes to lowercase hex string.
[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

/// Encode a 32-byte array to hex string.
[[nodiscard]] inline std::string toHex(const std::array<uint8_t, 32>& data) {
    return toHex(data.data(), data.size());
}

// =============================================================================
// Secure random generation
// =============================================================================

/// Fill a buffer from the OpenSSL CSPRNG. Returns false if the generator
/// could not be seeded.
[[nodiscard]] inline bool secureRandomFill(uint8_t* out, std::size_t length) {
    return RAND_bytes(out, static_cast<int>(length)) == 1;
}

/// Generate N cryptographically random bytes. Empty on generator failure.
[[nodiscard]] inline std::vector<uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<uint8_t> buf(numBytes);
    if (!secureRandomFill(buf.data(), buf.size())) {
        return {};
    }
    return buf;
}

/// Generate N random bytes, hex-encoded. Empty on generator failure.
[[nodiscard]] inline std::string secureRandomHex(std::size_t numBytes) {
    auto buf = secureRandomBytes(numBytes);
    return toHex(buf.data(), buf.size());
}

/// Random version-4 UUID in canonical 8-4-4-4-12 form.
[[nodiscard]] inline std::string newUuid() {
    std::array<uint8_t, 16> b{};
    if (!secureRandomFill(b.data(), b.size())) {
        return {};
    }
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);
    auto hex = toHex(b.data(), b.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two strings in constant time to prevent timing attacks.
/// Only the length is leaked.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

/// Byte-vector overload of constantTimeEqual.
[[nodiscard]] inline bool constantTimeEqual(const std::vector<uint8_t>& a,
                                            const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

/// True when the string is empty or only ASCII whitespace.
[[nodiscard]] inline bool isBlank(std::string_view s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v') {
            return false;
        }
    }
    return true;
}

}  // namespace cas::service::detail
