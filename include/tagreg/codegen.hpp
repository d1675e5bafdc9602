#pragma once

/**
 * @file codegen.hpp
 * @brief Build-time generation of headers embedding resolved identifiers
 *
 * The build runs `tagreg gen`, which resolves each requested type and tag
 * through the Registry and writes a header the program includes. The header
 * is only rewritten when its content changes, so dependent sources are not
 * recompiled needlessly.
 */

#include "tagreg/uuid.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tagreg {

class Registry;

class HeaderGenerator {
public:
    /// Namespace for custom tag constants (may be nested, "app::tags")
    void setNamespace(std::string ns) { namespace_ = std::move(ns); }

    /// Header included before the TypeTag specializations (types must be
    /// declared there). Written as #include "header".
    void addInclude(std::string header) { includes_.push_back(std::move(header)); }

    /// Request a type tag for a fully-qualified type name
    void addType(std::string typeName);

    /// Request a custom tag. spec is "NAME=tag" or just "tag"; without an
    /// explicit NAME the constant name is the tag with every character that
    /// can't appear in an identifier replaced by '_'.
    /// Throws std::invalid_argument for an unusable or duplicate name.
    void addTag(std::string_view spec);

    /// Resolve everything through the registry and render the header text
    [[nodiscard]] std::string render(Registry& registry) const;

    /// Render and write to path (atomically, and only if the content differs).
    /// Returns true if the file was written.
    bool writeTo(const std::filesystem::path& path, Registry& registry) const;

    /// Identifier derived from arbitrary tag text ("render.opaque" -> "render_opaque")
    [[nodiscard]] static std::string constantName(std::string_view tag);

private:
    struct TagRequest {
        std::string name;
        std::string tag;
    };

    std::string namespace_ = "tags";
    std::vector<std::string> includes_;
    std::vector<std::string> types_;
    std::vector<TagRequest> tags_;
};

/// C++ initializer for a Uuid: "tagreg::Uuid::Bytes{0x12, 0x34, ...}"
[[nodiscard]] std::string uuidInitializer(const Uuid& id);

}  // namespace tagreg
