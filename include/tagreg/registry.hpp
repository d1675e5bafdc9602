#pragma once

/**
 * @file registry.hpp
 * @brief Durable key -> UUID resolution against a shared tag store
 *
 * Every resolve() is one complete transaction against the store file:
 *
 *   1. shared lock, load, look up      -> found: return (no write)
 *   2. exclusive lock, reload, look up -> found: another process minted it
 *   3. mint a v4 UUID unused by any key, insert, atomic save, return
 *
 * Nothing is cached between calls; several build processes may resolve keys
 * against the same store concurrently, and each key gets exactly one
 * identifier for the lifetime of the store. Existing entries never change.
 *
 * Read-only calls (find, findType, load) never create files or directories;
 * a missing store reads as empty.
 *
 * Thread safety: a Registry may be shared between threads. Every call is its
 * own locked transaction and the only mutable member is an atomic flag.
 *
 * Usage:
 *   RegistryConfig config;
 *   config.storePath = "build/types.toml";
 *   Registry registry(config);
 *   Uuid point = registry.resolveType("geo::Point");
 *   Uuid tag = registry.resolveTag("render.opaque");
 */

#include "tagreg/registry_config.hpp"
#include "tagreg/registry_state.hpp"
#include "tagreg/tag_store.hpp"
#include "tagreg/uuid.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tagreg {

class Registry {
public:
    // Source of candidate identifiers (Uuid::generateV4 unless replaced)
    using Generator = std::function<Uuid()>;

    explicit Registry(RegistryConfig config);
    Registry(RegistryConfig config, Generator generator);

    /// Resolve a raw key in a namespace, minting and persisting a new
    /// identifier if the key is not yet in the store.
    /// Throws InvalidKey, StoreCorrupt, StoreUnwritable, KeyCollisionExhausted.
    Uuid resolve(TagNamespace ns, std::string_view key);

    /// Resolve a type tag. The key is derived from the type name with the
    /// effective keying scheme (see effectiveScheme).
    /// Additionally throws SchemeMismatch.
    Uuid resolveType(std::string_view typeName);

    /// Resolve a custom tag (the string is the key)
    Uuid resolveTag(std::string_view tag);

    /// Read-only lookup. Never writes.
    [[nodiscard]] std::optional<Uuid> find(TagNamespace ns, std::string_view key) const;

    /// Read-only lookup of a type name under the effective scheme
    [[nodiscard]] std::optional<Uuid> findType(std::string_view typeName) const;

    /// Parse the store without modifying it (empty if it doesn't exist)
    [[nodiscard]] RegistryState load() const;

    /// Atomically replace the store contents
    void save(const RegistryState& state);

    /// Keying scheme for type tags given the store's contents:
    /// configured scheme if explicit, else the recorded one, else Legacy for
    /// an unmarked store that already has type tags, else Qualified.
    /// Throws SchemeMismatch if an explicit scheme contradicts the record.
    [[nodiscard]] KeyScheme effectiveScheme(const RegistryState& state) const;

    [[nodiscard]] const RegistryConfig& config() const { return config_; }
    [[nodiscard]] const TagStore& store() const { return store_; }

private:
    using KeyFn = std::function<std::string(const RegistryState&)>;

    Uuid transact(TagNamespace ns, const KeyFn& keyFor);
    Uuid mint(const RegistryState& state, const std::string& key) const;
    [[nodiscard]] RegistryState readShared() const;
    void warnLegacy() const;

    RegistryConfig config_;
    TagStore store_;
    Generator generator_;
    mutable std::atomic<bool> warnedLegacy_{false};
};

}  // namespace tagreg
