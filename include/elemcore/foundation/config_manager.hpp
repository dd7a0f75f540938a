#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "elemcore/foundation/engine_result.hpp"

namespace elemcore::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key
/// access (e.g. "elemental.variance_min"), runtime set() and change
/// callbacks. The YAML tree is flattened into a key-value map; sequences
/// are stored as leaves so they can be read as std::vector<T>.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    EngineResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    EngineResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    EngineResult<T> get(std::string_view key) const;

    /// Set a value by dotted key and notify watchers for that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys sharing the given dotted prefix (e.g. "affinity.rows").
    [[nodiscard]] std::vector<std::string> keysWithPrefix(std::string_view prefix) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
EngineResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return EngineResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace elemcore::foundation
