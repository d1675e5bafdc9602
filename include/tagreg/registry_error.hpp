#pragma once

/**
 * @file registry_error.hpp
 * @brief Fatal registry failures
 *
 * Every failure is reported to the immediate caller. A build step that hits
 * one of these must stop: carrying on could re-mint identifiers.
 */

#include <filesystem>
#include <stdexcept>
#include <string>

namespace tagreg {

class RegistryError : public std::runtime_error {
public:
    RegistryError(const std::string& what, std::filesystem::path storePath, std::string key = {})
        : std::runtime_error(what), storePath_(std::move(storePath)), key_(std::move(key)) {}

    // Store the failure relates to (empty if none was involved)
    [[nodiscard]] const std::filesystem::path& storePath() const { return storePath_; }

    // Key being resolved when the failure happened (may be empty)
    [[nodiscard]] const std::string& key() const { return key_; }

private:
    std::filesystem::path storePath_;
    std::string key_;
};

// Store contents could not be parsed into the two tag tables
class StoreCorrupt : public RegistryError {
public:
    using RegistryError::RegistryError;
};

// Writing, replacing or locking the store failed
class StoreUnwritable : public RegistryError {
public:
    using RegistryError::RegistryError;
};

// Every freshly minted identifier was already taken
class KeyCollisionExhausted : public RegistryError {
public:
    using RegistryError::RegistryError;
};

// Key rejected before any I/O
class InvalidKey : public RegistryError {
public:
    using RegistryError::RegistryError;
};

// Configured key scheme contradicts the one recorded in the store
class SchemeMismatch : public RegistryError {
public:
    using RegistryError::RegistryError;
};

}  // namespace tagreg
