#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration store with typed, dotted-key access.

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gbe/foundation/battle_result.hpp"

namespace gbe::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g., "wave.scroll_distance") and overriding values at runtime.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
///
/// Thread safety: None. Configuration is read once before a battle starts.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any current entries.
    /// @return Success or ConfigLoadFailed error.
    BattleResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing any current entries.
    /// @return Success or ConfigLoadFailed error.
    BattleResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key (e.g., "grid.width").
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    BattleResult<T> get(std::string_view key) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys currently stored, sorted.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
BattleResult<T> ConfigManager::get(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return BattleResult<T>::err(
            BattleError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return BattleResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return BattleResult<T>::err(
            BattleError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace gbe::foundation
