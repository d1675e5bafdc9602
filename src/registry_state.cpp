#include "tagreg/registry_state.hpp"

#include <algorithm>
#include <initializer_list>
#include <unordered_map>

namespace tagreg {

const RegistryState::Table& RegistryState::table(TagNamespace ns) const {
    return ns == TagNamespace::Type ? typeTags_ : customTags_;
}

RegistryState::Table& RegistryState::tableFor(TagNamespace ns) {
    return ns == TagNamespace::Type ? typeTags_ : customTags_;
}

std::optional<Uuid> RegistryState::find(TagNamespace ns, std::string_view key) const {
    const auto& t = table(ns);
    auto it = t.find(key);
    if (it != t.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool RegistryState::contains(const Uuid& id) const {
    for (const auto* t : {&typeTags_, &customTags_}) {
        for (const auto& [key, value] : *t) {
            if (value == id) return true;
        }
    }
    return false;
}

bool RegistryState::insert(TagNamespace ns, std::string_view key, const Uuid& id) {
    auto& t = tableFor(ns);
    if (t.find(key) != t.end()) {
        return false;
    }
    t.emplace(std::string(key), id);
    return true;
}

std::vector<std::pair<Uuid, std::vector<std::string>>> RegistryState::duplicateIdentifiers() const {
    std::unordered_map<Uuid, std::vector<std::string>> users;
    for (auto ns : {TagNamespace::Type, TagNamespace::Custom}) {
        for (const auto& [key, value] : table(ns)) {
            users[value].push_back(std::string(namespaceName(ns)) + ":" + key);
        }
    }

    std::vector<std::pair<Uuid, std::vector<std::string>>> result;
    for (auto& [id, keys] : users) {
        if (keys.size() > 1) {
            result.emplace_back(id, std::move(keys));
        }
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

}  // namespace tagreg
