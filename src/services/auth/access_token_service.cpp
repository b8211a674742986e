/// @file access_token_service.cpp
/// @brief AccessTokenService implementation.

#include "cas/service/access_token_service.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"
#include "json_utils.hpp"

#include <charconv>
#include <exception>
#include <sstream>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;

namespace {

/// Convert time_point to seconds since epoch.
int64_t toEpoch(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

/// Convert seconds-since-epoch to time_point.
TimePoint fromEpoch(int64_t epoch) {
    return TimePoint(std::chrono::seconds(epoch));
}

/// Parse the integral part of a NumericDate.
std::optional<int64_t> parseNumericDate(std::string_view text) {
    auto dot = text.find('.');
    if (dot != std::string_view::npos) {
        text = text.substr(0, dot);
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Split a string by delimiter.
std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

/// Non-blank entries of @p values, in order.
std::vector<std::string> nonBlank(const std::vector<std::string>& values) {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (!detail::isBlank(v)) {
            out.push_back(v);
        }
    }
    return out;
}

/// A single value as a JSON string, several as a JSON array.
std::string stringOrArray(const std::vector<std::string>& values) {
    if (values.size() == 1) {
        return detail::jsonEscape(values.front());
    }
    return detail::jsonStringArray(values);
}

void rejectDecode(std::string_view reason) {
    CAS_LOG_DEBUG(LogCategory::Token, "Access token rejected: " + std::string(reason));
}

}  // anonymous namespace

AccessTokenService::AccessTokenService(JwtSettings settings, std::unique_ptr<ITokenSigner> signer)
    : settings_(std::move(settings)), signer_(std::move(signer)) {
    // Key material lives only inside the signer.
    settings_.signingKey.clear();
}

AuthResult<std::unique_ptr<AccessTokenService>> AccessTokenService::create(JwtSettings settings) {
    using ResultT = AuthResult<std::unique_ptr<AccessTokenService>>;
    auto signer = loadTokenSigner(settings);
    if (!signer) {
        return ResultT::err(signer.error());
    }
    return ResultT::ok(
        std::make_unique<AccessTokenService>(std::move(settings), std::move(signer).value()));
}

AuthResult<std::string> AccessTokenService::generateToken(
    const UserIdentity& user,
    const std::vector<std::string>& roles,
    const std::vector<std::string>& scopes) const {
    return generateTokenFor(user, roles, settings_.issuer, settings_.audience, scopes);
}

AuthResult<std::string> AccessTokenService::generateTokenFor(
    const UserIdentity& user,
    const std::vector<std::string>& roles,
    std::string_view issuer,
    std::string_view audience,
    const std::vector<std::string>& scopes) const {
    if (user.id.empty() || user.tenantId.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidArgument, "user id and tenant id are required"));
    }

    auto jti = detail::newUuid();
    if (jti.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoError, "random generator unavailable"));
    }

    const std::string header = "{\"alg\":" + detail::jsonEscape(signer_->algorithmName()) +
                               ",\"kid\":" + detail::jsonEscape(signer_->keyId()) +
                               ",\"typ\":\"JWT\"}";

    auto now = Clock::now();
    auto filteredRoles = nonBlank(roles);
    auto filteredScopes = nonBlank(scopes);

    // Build payload JSON.
    std::ostringstream payload;
    payload << "{\"sub\":" << detail::jsonEscape(user.id)
            << ",\"jti\":" << detail::jsonEscape(jti)
            << ",\"email\":" << detail::jsonEscape(user.email.value_or(""))
            << ",\"unique_name\":" << detail::jsonEscape(user.userName)
            << ",\"tenant_id\":" << detail::jsonEscape(user.tenantId) << ","
            << detail::jsonEscape(claim_names::kTenantIdCompat) << ":"
            << detail::jsonEscape(user.tenantId)
            << ",\"user_id\":" << detail::jsonEscape(user.id);
    if (!filteredRoles.empty()) {
        payload << ",\"role\":" << stringOrArray(filteredRoles);
    }
    // The aggregate carries the role list as given, blanks included.
    if (!roles.empty()) {
        payload << ",\"roles\":" << detail::jsonStringArray(roles);
    }
    if (user.firstName && !user.firstName->empty()) {
        payload << ",\"given_name\":" << detail::jsonEscape(*user.firstName);
    }
    if (user.lastName && !user.lastName->empty()) {
        payload << ",\"family_name\":" << detail::jsonEscape(*user.lastName);
    }
    if (!filteredScopes.empty()) {
        payload << ",\"scope\":" << stringOrArray(filteredScopes);
    }
    payload << ",\"exp\":" << toEpoch(now + settings_.expiration) << ",\"iat\":" << toEpoch(now)
            << ",\"iss\":" << detail::jsonEscape(issuer)
            << ",\"aud\":" << detail::jsonEscape(audience) << "}";

    std::string signingInput = detail::base64urlEncode(header) + "." +
                               detail::base64urlEncode(payload.str());

    auto signature = signer_->sign(signingInput);
    if (!signature) {
        return AuthResult<std::string>::err(signature.error());
    }
    return AuthResult<std::string>::ok(
        signingInput + "." +
        detail::base64urlEncode(signature.value().data(), signature.value().size()));
}

std::optional<DecodedAccessToken> AccessTokenService::validateAndDecode(
    std::string_view token, bool validateSignature) const {
    try {
        return decode(token, validateSignature);
    } catch (const std::exception& e) {
        CAS_LOG_WARN(LogCategory::Token,
                     std::string("Access token decoding failed: ") + e.what());
        return std::nullopt;
    }
}

std::optional<DecodedAccessToken> AccessTokenService::decode(std::string_view token,
                                                             bool validateSignature) const {
    auto parts = split(token, '.');
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty()) {
        rejectDecode("malformed JWS: expected 3 parts");
        return std::nullopt;
    }

    auto headerBytes = detail::base64urlDecodeStrict(parts[0]);
    auto payloadBytes = detail::base64urlDecodeStrict(parts[1]);
    if (!headerBytes || !payloadBytes) {
        rejectDecode("header or payload is not base64url");
        return std::nullopt;
    }
    auto header = detail::parseFlatJsonObject(
        std::string_view(reinterpret_cast<const char*>(headerBytes->data()), headerBytes->size()));
    auto payload = detail::parseFlatJsonObject(std::string_view(
        reinterpret_cast<const char*>(payloadBytes->data()), payloadBytes->size()));
    if (!header || !payload) {
        rejectDecode("header or payload is not a JSON object");
        return std::nullopt;
    }

    DecodedAccessToken decoded;
    decoded.algorithm = detail::memberString(*header, "alg").value_or("");
    decoded.keyId = detail::memberString(*header, "kid").value_or("");

    if (validateSignature) {
        if (decoded.algorithm != signer_->algorithmName()) {
            rejectDecode("unexpected alg " + decoded.algorithm);
            return std::nullopt;
        }
        if (decoded.keyId != signer_->keyId()) {
            rejectDecode("unknown kid " + decoded.keyId);
            return std::nullopt;
        }
        auto signature = detail::base64urlDecodeStrict(parts[2]);
        if (!signature || signature->empty()) {
            rejectDecode("signature is not base64url");
            return std::nullopt;
        }
        std::string signingInput = std::string(parts[0]) + "." + std::string(parts[1]);
        if (!signer_->verify(signingInput, *signature)) {
            rejectDecode("signature mismatch");
            return std::nullopt;
        }
        decoded.signatureVerified = true;
    }

    // Claims in payload order; arrays become one claim per element except
    // the "roles" aggregate, which stays one JSON-valued claim.
    auto& claims = decoded.claims;
    bool audienceMatched = false;
    for (const auto& [name, value] : *payload) {
        if (value.kind == detail::JsonValue::Kind::Null) {
            continue;
        }
        if (value.isArray()) {
            if (name == claim_names::kRoles) {
                decoded.rawClaims.push_back({name, value.raw});
                continue;
            }
            for (const auto& item : value.items) {
                decoded.rawClaims.push_back({name, item});
            }
        } else {
            decoded.rawClaims.push_back({name, value.text});
        }

        std::vector<std::string> values = value.isArray() ? value.items
                                                          : std::vector<std::string>{value.text};
        if (name == claim_names::kSubject) {
            claims.subject = value.text;
        } else if (name == claim_names::kJwtId) {
            claims.jti = value.text;
        } else if (name == claim_names::kEmail) {
            claims.email = value.text;
        } else if (name == claim_names::kUniqueName) {
            claims.userName = value.text;
        } else if (name == claim_names::kTenantId) {
            claims.tenantId = value.text;
        } else if (name == claim_names::kUserId) {
            claims.userId = value.text;
        } else if (name == claim_names::kRole) {
            claims.roles.insert(claims.roles.end(), values.begin(), values.end());
        } else if (name == claim_names::kGivenName) {
            claims.givenName = value.text;
        } else if (name == claim_names::kSurname) {
            claims.surname = value.text;
        } else if (name == claim_names::kScope) {
            claims.scopes.insert(claims.scopes.end(), values.begin(), values.end());
        } else if (name == claim_names::kIssuer) {
            claims.issuer = value.text;
        } else if (name == claim_names::kAudience) {
            claims.audience = values.empty() ? std::string() : values.front();
            for (const auto& aud : values) {
                if (aud == settings_.audience) {
                    audienceMatched = true;
                    claims.audience = aud;
                }
            }
        } else if (name == claim_names::kExpires) {
            if (auto epoch = parseNumericDate(value.text)) {
                claims.expiresAt = fromEpoch(*epoch);
            }
        } else if (name == claim_names::kIssuedAt) {
            if (auto epoch = parseNumericDate(value.text)) {
                claims.issuedAt = fromEpoch(*epoch);
            }
        }
    }

    if (validateSignature) {
        if (claims.issuer != settings_.issuer) {
            rejectDecode("issuer mismatch");
            return std::nullopt;
        }
        if (!audienceMatched) {
            rejectDecode("audience mismatch");
            return std::nullopt;
        }
    }
    return decoded;
}

std::string AccessTokenService::exportPublicJwk() const {
    return signer_->exportPublicJwk();
}

std::string AccessTokenService::exportFullJwk() const {
    return signer_->exportFullJwk();
}

std::string AccessTokenService::publicJwks() const {
    return "{\"keys\":[" + signer_->exportPublicJwk() + "]}";
}

}  // namespace cas::service
