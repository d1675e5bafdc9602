#pragma once

/**
 * @file registry_state.hpp
 * @brief In-memory image of the tag store
 *
 * Two tables (type tags, custom tags), each key -> Uuid, plus the keying
 * scheme recorded when the store was first written. Entries are append-only:
 * insert() never replaces an existing key.
 *
 * Tables are ordered so the serialized store is deterministic.
 */

#include "tagreg/tag_key.hpp"
#include "tagreg/uuid.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagreg {

class RegistryState {
public:
    using Table = std::map<std::string, Uuid, std::less<>>;

    RegistryState() = default;

    [[nodiscard]] const Table& table(TagNamespace ns) const;

    [[nodiscard]] std::optional<Uuid> find(TagNamespace ns, std::string_view key) const;

    /// True if any key in either table maps to this identifier
    [[nodiscard]] bool contains(const Uuid& id) const;

    /// Add a new entry. Returns false (and changes nothing) if the key exists.
    bool insert(TagNamespace ns, std::string_view key, const Uuid& id);

    [[nodiscard]] size_t size() const { return typeTags_.size() + customTags_.size(); }
    [[nodiscard]] bool empty() const { return typeTags_.empty() && customTags_.empty(); }

    // Scheme recorded in the store (nullopt for stores that predate the field)
    [[nodiscard]] std::optional<KeyScheme> keyScheme() const { return keyScheme_; }
    void setKeyScheme(std::optional<KeyScheme> scheme) { keyScheme_ = scheme; }

    /// Identifiers mapped from more than one key, with every key that uses
    /// them as "namespace:key" strings. Empty for a consistent store.
    [[nodiscard]] std::vector<std::pair<Uuid, std::vector<std::string>>> duplicateIdentifiers() const;

    bool operator==(const RegistryState&) const = default;

private:
    Table& tableFor(TagNamespace ns);

    Table typeTags_;
    Table customTags_;
    std::optional<KeyScheme> keyScheme_;
};

}  // namespace tagreg
