/// @file token_types.cpp
/// @brief Out-of-line helpers for the shared token types.

#include "cas/service/token_types.hpp"

namespace cas::service {

std::optional<std::string> DecodedAccessToken::find(std::string_view type) const {
    for (const auto& claim : rawClaims) {
        if (claim.type == type) {
            return claim.value;
        }
    }
    return std::nullopt;
}

std::vector<std::string> DecodedAccessToken::findAll(std::string_view type) const {
    std::vector<std::string> values;
    for (const auto& claim : rawClaims) {
        if (claim.type == type) {
            values.push_back(claim.value);
        }
    }
    return values;
}

std::string_view signatureAlgorithmName(SignatureAlgorithm alg) {
    switch (alg) {
        case SignatureAlgorithm::RS256:
            return "RS256";
        case SignatureAlgorithm::EdDSA:
            return "EdDSA";
        case SignatureAlgorithm::MlDsa65:
            return "ML-DSA-65";
    }
    return "RS256";
}

std::optional<SignatureAlgorithm> parseSignatureAlgorithm(std::string_view name) {
    if (name == "RS256") {
        return SignatureAlgorithm::RS256;
    }
    if (name == "EdDSA" || name == "Ed25519") {
        return SignatureAlgorithm::EdDSA;
    }
    if (name == "ML-DSA-65" || name == "MLDSA65") {
        return SignatureAlgorithm::MlDsa65;
    }
    return std::nullopt;
}

}  // namespace cas::service
