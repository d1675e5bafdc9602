#pragma once

/**
 * @file registry_config.hpp
 * @brief Registry settings (store location, keying scheme, limits)
 *
 * Config file format (key: value pairs, see ConfigFile):
 *   store.path: types.toml
 *   store.key_scheme: auto
 *   lock.timeout_ms: 30000
 *   mint.max_attempts: 8
 *   debug.logging: false
 *
 * Precedence: command line > environment > config file > defaults.
 */

#include "tagreg/tag_key.hpp"

#include <chrono>
#include <filesystem>

namespace tagreg {

struct RegistryConfig {
    static constexpr const char* DEFAULT_STORE_NAME = "types.toml";
    static constexpr const char* DEFAULT_CONFIG_NAME = "tagreg.conf";

    std::filesystem::path storePath = DEFAULT_STORE_NAME;
    KeyScheme keyScheme = KeyScheme::Auto;
    std::chrono::milliseconds lockTimeout{30000};
    int maxMintAttempts = 8;
    bool verbose = false;

    /// Load settings from a config file. A missing file yields defaults.
    /// A relative store.path is taken relative to the config file's directory.
    /// Throws std::invalid_argument for malformed values.
    [[nodiscard]] static RegistryConfig fromFile(const std::filesystem::path& configPath);

    /// Apply TAGREG_STORE and TAGREG_KEY_SCHEME if set.
    /// Throws std::invalid_argument for an unknown scheme.
    void applyEnvironment();

    /// Write a commented config file holding the default settings.
    /// Returns false if it can't be written.
    [[nodiscard]] static bool writeDefaults(const std::filesystem::path& configPath);
};

}  // namespace tagreg
