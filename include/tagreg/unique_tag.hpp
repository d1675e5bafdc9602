#pragma once

/**
 * @file unique_tag.hpp
 * @brief Compile-time access to identifiers embedded by generated headers
 *
 * Headers written by `tagreg gen` specialize TypeTag for each requested type
 * and define constants for custom tags:
 *
 *   namespace tagreg {
 *   template<>
 *   struct TypeTag<::geo::Point> {
 *       static constexpr Uuid value{Uuid::Bytes{0x0f, 0x1e, ...}};
 *   };
 *   }
 *
 *   namespace tags {
 *   inline constexpr tagreg::Uuid render_opaque{tagreg::Uuid::Bytes{...}};
 *   }
 *
 * Usage:
 *   constexpr tagreg::Uuid id = tagreg::typeTagOf<geo::Point>();
 */

#include "tagreg/uuid.hpp"

namespace tagreg {

// Specialized by generated headers; no definition for untagged types
template<typename T>
struct TypeTag;

template<typename T>
constexpr Uuid typeTagOf() {
    return TypeTag<T>::value;
}

}  // namespace tagreg
