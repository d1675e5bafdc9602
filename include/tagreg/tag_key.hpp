#pragma once

/**
 * @file tag_key.hpp
 * @brief Tag namespaces, type-name keying schemes and key validation
 *
 * A lookup key is (namespace, string). The two namespaces are stored in
 * separate tables, so "X" as a type and "X" as a custom tag are unrelated.
 *
 * Type-tag keys depend on the keying scheme:
 *   Qualified  "geo::Point"  full path, leading "::" and spacing normalized
 *   Legacy     "::Point"     bare name only; distinct types sharing a simple
 *                            name collide. Only for stores written that way.
 *   Auto       whatever the store records (see Registry::effectiveScheme)
 */

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tagreg {

enum class TagNamespace {
    Type,
    Custom
};

enum class KeyScheme {
    Auto,
    Qualified,
    Legacy
};

/// Table name used in the store ("type_tags" / "custom_tags")
[[nodiscard]] std::string_view tableName(TagNamespace ns);

/// Human-readable namespace name ("type-tag" / "custom-tag")
[[nodiscard]] std::string_view namespaceName(TagNamespace ns);

[[nodiscard]] std::string_view schemeName(KeyScheme scheme);

/// Parse "auto", "qualified" or "legacy". Returns nullopt otherwise.
[[nodiscard]] std::optional<KeyScheme> parseScheme(std::string_view text);

/// Collapse whitespace in a type name and drop a leading "::".
/// "  ::std::vector< unsigned  int >" -> "std::vector<unsigned int>"
[[nodiscard]] std::string normalizeTypeName(std::string_view name);

/// Last path component outside template arguments, without its own
/// template argument list. "a::b::Point<c::D>" -> "Point"
[[nodiscard]] std::string bareTypeName(std::string_view name);

/// Derive the type-tag key for a type name under a concrete scheme.
/// scheme must not be Auto.
[[nodiscard]] std::string typeKey(std::string_view typeName, KeyScheme scheme);

/// Reject keys that can never be stored: empty, control characters,
/// leading/trailing whitespace. Throws InvalidKey.
void validateKey(TagNamespace ns, std::string_view key,
                 const std::filesystem::path& storePath = {});

/// Structural check of a type name (after normalization): no empty path
/// components, no trailing "::", balanced angle brackets. Throws InvalidKey.
void validateTypeName(std::string_view typeName,
                      const std::filesystem::path& storePath = {});

}  // namespace tagreg
