#include "cas/foundation/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

extern char** environ;

namespace cas::foundation {

AuthResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return AuthResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

AuthResult<void> ConfigManager::loadString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return AuthResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

std::size_t ConfigManager::applyEnvironmentOverrides(std::string_view prefix) {
    std::vector<std::pair<std::string, std::string>> overrides;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string_view entry(*env);
        auto eq = entry.find('=');
        if (eq == std::string_view::npos || entry.substr(0, prefix.size()) != prefix) {
            continue;
        }
        auto name = std::string(entry.substr(prefix.size(), eq - prefix.size()));
        if (name.empty()) {
            continue;
        }

        std::string key;
        key.reserve(name.size());
        for (std::size_t i = 0; i < name.size(); ++i) {
            if (name[i] == '_' && i + 1 < name.size() && name[i + 1] == '_') {
                key.push_back('.');
                ++i;
            } else {
                key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
            }
        }
        overrides.emplace_back(std::move(key), std::string(entry.substr(eq + 1)));
    }

    for (const auto& [key, value] : overrides) {
        set<std::string>(key, value);
    }
    return overrides.size();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null), stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace cas::foundation
