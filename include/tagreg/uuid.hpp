#pragma once

/**
 * @file uuid.hpp
 * @brief 128-bit identifier assigned to tagged entities
 *
 * Text form is the canonical 8-4-4-4-12 hyphenated hex, lower case on output.
 * New identifiers are random version-4 UUIDs.
 */

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tagreg {

class Uuid {
public:
    using Bytes = std::array<uint8_t, 16>;

    static constexpr size_t STRING_LENGTH = 36;

    // Nil UUID (all zero)
    constexpr Uuid() = default;
    constexpr explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /// Generate a random version-4 UUID (RFC 4122 variant)
    [[nodiscard]] static Uuid generateV4();

    /// Parse canonical 8-4-4-4-12 text, either case.
    /// Returns nullopt for anything else (braces, urn: prefix, wrong length).
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view text);

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] constexpr const Bytes& bytes() const { return bytes_; }

    [[nodiscard]] constexpr bool isNil() const {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    // Version nibble (4 for generated identifiers)
    [[nodiscard]] constexpr int version() const { return bytes_[6] >> 4; }

    constexpr bool operator==(const Uuid&) const = default;
    constexpr auto operator<=>(const Uuid&) const = default;

private:
    Bytes bytes_{};
};

}  // namespace tagreg

template<>
struct std::hash<tagreg::Uuid> {
    size_t operator()(const tagreg::Uuid& uuid) const noexcept {
        const auto& b = uuid.bytes();
        uint64_t hi = 0;
        uint64_t lo = 0;
        for (size_t i = 0; i < 8; ++i) {
            hi = (hi << 8) | b[i];
            lo = (lo << 8) | b[i + 8];
        }
        return std::hash<uint64_t>{}(hi ^ (lo * 0x9e3779b97f4a7c15ULL));
    }
};
