/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "cas/service/service_runner.hpp"

#include <cstdlib>
#include <string_view>

#include "cas/foundation/auth_logger.hpp"

namespace cas::service {

// -- Config loading ----------------------------------------------------------

cas::foundation::AuthResult<void>
loadConfig(cas::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    // Environment variable override for 12-factor compliance.
    const char* envPath = std::getenv("CAS_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    auto loaded = config.load(configPath);
    if (!loaded) {
        return loaded;
    }

    auto overridden = config.applyEnvironmentOverrides("CAS_");
    if (overridden > 0) {
        CAS_LOG_INFO(cas::foundation::LogCategory::Config,
                     std::to_string(overridden) + " configuration key(s) overridden from environment");
    }
    return loaded;
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    auto path = parseOptionArg(argc, argv, "config");
    if (!path) {
        return {};
    }
    return *path;
}

std::optional<std::string> parseOptionArg(int argc, char* argv[], std::string_view name) {
    for (int i = 1; i < argc - 1; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.size() == name.size() + 2 && arg.substr(0, 2) == "--" && arg.substr(2) == name) {
            return std::string(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

} // namespace cas::service
