/// @file main.cpp
/// @brief Signing key generator.
///
/// Generates a fresh access token signing key and prints it as a full JWK,
/// a public JWK and a base64-encoded full JWK suitable for the
/// `jwt.signing_key` setting (or the CAS_JWT__SIGNING_KEY variable).
///
/// Usage:
///   cas_keygen [--algorithm RS256|EdDSA|ML-DSA-65] [--key-id id]
///              [--out dir] [--config path]

#include "cas/foundation/config_manager.hpp"
#include "cas/service/auth_config.hpp"
#include "cas/service/service_runner.hpp"
#include "cas/service/token_signer.hpp"

#include <openssl/evp.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::string toBase64(const std::string& text) {
    std::vector<unsigned char> out(4 * ((text.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<std::size_t>(written));
}

bool writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content << '\n';
    return static_cast<bool>(out);
}

void printUsage() {
    std::cerr << "usage: cas_keygen [--algorithm RS256|EdDSA|ML-DSA-65] [--key-id id]"
                 " [--out dir] [--config path]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return EXIT_SUCCESS;
        }
    }

    // Defaults come from the configuration when one is given.
    cas::service::JwtSettings settings;
    auto configPath = cas::service::parseConfigArg(argc, argv);
    if (!configPath.empty()) {
        cas::foundation::ConfigManager config;
        auto loadResult = cas::service::loadConfig(config, configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
        auto authConfig = cas::service::loadAuthConfig(config);
        if (!authConfig) {
            std::cerr << "Invalid config: " << authConfig.error().message() << "\n";
            return EXIT_FAILURE;
        }
        settings = authConfig.value().jwt;
    }

    if (auto name = cas::service::parseOptionArg(argc, argv, "algorithm")) {
        auto algorithm = cas::service::parseSignatureAlgorithm(*name);
        if (!algorithm) {
            std::cerr << "Unknown algorithm '" << *name << "'\n";
            printUsage();
            return EXIT_FAILURE;
        }
        settings.algorithm = *algorithm;
    }
    if (auto keyId = cas::service::parseOptionArg(argc, argv, "key-id")) {
        settings.keyId = *keyId;
    }

    auto signer = cas::service::generateSigner(settings.algorithm, settings.keyId,
                                               settings.rsaKeyBits);
    if (!signer) {
        std::cerr << "Key generation failed: " << signer.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto fullJwk = signer.value()->exportFullJwk();
    const auto publicJwk = signer.value()->exportPublicJwk();
    const auto encoded = toBase64(fullJwk);

    std::cout << "Algorithm: " << signer.value()->algorithmName() << "\n"
              << "Key id:    " << signer.value()->keyId() << "\n\n"
              << "Full JWK (keep secret):\n" << fullJwk << "\n\n"
              << "Public JWK:\n" << publicJwk << "\n\n"
              << "Base64 full JWK (jwt.signing_key / CAS_JWT__SIGNING_KEY):\n"
              << encoded << "\n";

    if (auto outDir = cas::service::parseOptionArg(argc, argv, "out")) {
        std::error_code ec;
        std::filesystem::create_directories(*outDir, ec);
        if (ec) {
            std::cerr << "Cannot create " << *outDir << ": " << ec.message() << "\n";
            return EXIT_FAILURE;
        }
        const std::filesystem::path dir(*outDir);
        if (!writeFile(dir / "signing_jwk.json", fullJwk) ||
            !writeFile(dir / "signing_jwk_base64.txt", encoded)) {
            std::cerr << "Failed to write key files to " << dir.string() << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "\nWrote " << (dir / "signing_jwk.json").string() << " and "
                  << (dir / "signing_jwk_base64.txt").string() << "\n";
    }
    return EXIT_SUCCESS;
}
