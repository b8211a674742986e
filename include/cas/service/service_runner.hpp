#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for executable entry points.
///
/// Provides configuration loading and CLI argument parsing for the
/// CAS executables.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "cas/foundation/auth_result.hpp"
#include "cas/foundation/config_manager.hpp"

namespace cas::service {

/// Load a YAML configuration file into the provided ConfigManager, then
/// overlay `CAS_`-prefixed environment variables.
///
/// The config file path is resolved in order:
///   1. CAS_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @param config      ConfigManager to populate.
/// @param defaultPath Fallback config file path.
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] cas::foundation::AuthResult<void>
loadConfig(cas::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Value of `--<name> <value>` from command-line arguments, if present.
[[nodiscard]] std::optional<std::string>
parseOptionArg(int argc, char* argv[], std::string_view name);

} // namespace cas::service
