#pragma once

/**
 * @file store_format.hpp
 * @brief Text form of the tag store (a small subset of TOML)
 *
 * Format:
 * ```
 * # Comments start with #
 * key_scheme = "qualified"
 *
 * [custom_tags]
 * "test1" = "67e55044-10b1-426f-9247-bb680e5fe0c8"
 *
 * [type_tags]
 * "geo::Point" = "0f1e2d3c-4b5a-4968-8776-a5b4c3d2e1f0"
 * ```
 *
 * Accepted on input:
 * - bare keys, "basic" strings with TOML escapes, 'literal' strings
 * - [unique_tags] / [unique_type_tags] as aliases of the two tables
 *   (names used by stores written before the tables were renamed)
 * - an optional top-level key_scheme ("qualified" or "legacy")
 *
 * Everything else (other tables or keys, non-string values, duplicate keys,
 * malformed identifiers) is a StoreCorrupt error naming the line. Parsing
 * either returns the complete state or throws; it never returns part of one.
 */

#include "tagreg/registry_state.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace tagreg {

/// Parse store text. source is only used in error messages.
[[nodiscard]] RegistryState parseStore(std::string_view content,
                                       const std::filesystem::path& source = {});

/// Serialize a state. Output is deterministic (sorted keys, both tables
/// always present) and parseStore(formatStore(s)) == s.
[[nodiscard]] std::string formatStore(const RegistryState& state);

/// Quote a key as a TOML basic string
[[nodiscard]] std::string quoteKey(std::string_view key);

}  // namespace tagreg
