#include "tagreg/registry.hpp"
#include "tagreg/file_lock.hpp"
#include "tagreg/registry_error.hpp"

#include <iostream>

namespace tagreg {

namespace {

// Scheme the store was written with. Stores that predate the key_scheme
// field but already hold type tags were keyed by bare name.
std::optional<KeyScheme> storeScheme(const RegistryState& state) {
    if (auto recorded = state.keyScheme()) {
        return recorded;
    }
    if (!state.table(TagNamespace::Type).empty()) {
        return KeyScheme::Legacy;
    }
    return std::nullopt;
}

}  // anonymous namespace

Registry::Registry(RegistryConfig config)
    : Registry(std::move(config), &Uuid::generateV4) {
}

Registry::Registry(RegistryConfig config, Generator generator)
    : config_(std::move(config)), store_(config_.storePath), generator_(std::move(generator)) {
    if (config_.maxMintAttempts < 1) {
        config_.maxMintAttempts = 1;
    }
}

// ============================================================================
// Resolution
// ============================================================================

Uuid Registry::resolve(TagNamespace ns, std::string_view key) {
    validateKey(ns, key, store_.path());
    std::string owned(key);
    return transact(ns, [&owned](const RegistryState&) { return owned; });
}

Uuid Registry::resolveType(std::string_view typeName) {
    validateTypeName(typeName, store_.path());
    return transact(TagNamespace::Type, [this, typeName](const RegistryState& state) {
        KeyScheme scheme = effectiveScheme(state);
        if (scheme == KeyScheme::Legacy) {
            warnLegacy();
        }
        std::string key = typeKey(typeName, scheme);
        validateKey(TagNamespace::Type, key, store_.path());
        return key;
    });
}

Uuid Registry::resolveTag(std::string_view tag) {
    return resolve(TagNamespace::Custom, tag);
}

Uuid Registry::transact(TagNamespace ns, const KeyFn& keyFor) {
    // Fast path: most keys already exist, and readers don't block each other
    {
        RegistryState state = readShared();
        if (auto found = state.find(ns, keyFor(state))) {
            return *found;
        }
    }

    FileLock lock(store_.lockPath(), LockMode::Exclusive, config_.lockTimeout, store_.path());
    store_.removeStaleTemporaries();

    // Re-read: another process may have minted this key between the locks
    RegistryState state = store_.read();
    std::string key = keyFor(state);
    if (auto found = state.find(ns, key)) {
        return *found;
    }

    if (!state.keyScheme()) {
        // Custom tags don't use the type keying scheme: record what the store
        // implies without checking it against the configured one
        if (ns == TagNamespace::Type) {
            state.setKeyScheme(effectiveScheme(state));
        } else {
            state.setKeyScheme(storeScheme(state).value_or(
                config_.keyScheme == KeyScheme::Auto ? KeyScheme::Qualified : config_.keyScheme));
        }
    }

    Uuid id = mint(state, key);
    state.insert(ns, key, id);
    store_.write(state);

    if (config_.verbose) {
        std::cerr << "[Registry] " << namespaceName(ns) << " \"" << key << "\" -> "
                  << id.toString() << " (" << store_.path().string() << ")\n";
    }
    return id;
}

Uuid Registry::mint(const RegistryState& state, const std::string& key) const {
    for (int attempt = 0; attempt < config_.maxMintAttempts; ++attempt) {
        Uuid candidate = generator_();
        if (!candidate.isNil() && !state.contains(candidate)) {
            return candidate;
        }
        if (config_.verbose) {
            std::cerr << "[Registry] identifier " << candidate.toString()
                      << " already taken, regenerating\n";
        }
    }
    throw KeyCollisionExhausted("no unused identifier for key \"" + key + "\" after " +
                                std::to_string(config_.maxMintAttempts) + " attempts",
                                store_.path(), key);
}

// ============================================================================
// Read-only access
// ============================================================================

RegistryState Registry::readShared() const {
    // Nothing to lock against; never create the store's directory just to read
    if (!store_.exists()) {
        return RegistryState{};
    }
    FileLock lock(store_.lockPath(), LockMode::Shared, config_.lockTimeout, store_.path());
    return store_.read();
}

std::optional<Uuid> Registry::find(TagNamespace ns, std::string_view key) const {
    validateKey(ns, key, store_.path());
    return readShared().find(ns, key);
}

std::optional<Uuid> Registry::findType(std::string_view typeName) const {
    validateTypeName(typeName, store_.path());
    RegistryState state = readShared();
    KeyScheme scheme = effectiveScheme(state);
    if (scheme == KeyScheme::Legacy) {
        warnLegacy();
    }
    return state.find(TagNamespace::Type, typeKey(typeName, scheme));
}

RegistryState Registry::load() const {
    return readShared();
}

void Registry::save(const RegistryState& state) {
    FileLock lock(store_.lockPath(), LockMode::Exclusive, config_.lockTimeout, store_.path());
    store_.removeStaleTemporaries();
    store_.write(state);
}

// ============================================================================
// Keying scheme
// ============================================================================

KeyScheme Registry::effectiveScheme(const RegistryState& state) const {
    auto recorded = storeScheme(state);
    if (config_.keyScheme == KeyScheme::Auto) {
        return recorded.value_or(KeyScheme::Qualified);
    }
    if (recorded && *recorded != config_.keyScheme) {
        throw SchemeMismatch("store " + store_.path().string() + " uses " +
                             std::string(schemeName(*recorded)) + " type keys but " +
                             std::string(schemeName(config_.keyScheme)) + " was requested",
                             store_.path());
    }
    return config_.keyScheme;
}

void Registry::warnLegacy() const {
    if (warnedLegacy_.exchange(true)) {
        return;
    }
    std::cerr << "[Registry] WARNING: " << store_.path().string()
              << " uses legacy bare-name type keys; distinct types with the same"
              << " simple name share one identifier\n";
}

}  // namespace tagreg
