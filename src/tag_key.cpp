#include "tagreg/tag_key.hpp"
#include "tagreg/registry_error.hpp"

#include <cctype>

namespace tagreg {

namespace {

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isControl(char c) {
    auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7F;
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string describe(TagNamespace ns, std::string_view key) {
    std::string s(namespaceName(ns));
    s += " key \"";
    s += key;
    s += "\"";
    return s;
}

}  // anonymous namespace

std::string_view tableName(TagNamespace ns) {
    switch (ns) {
        case TagNamespace::Type: return "type_tags";
        case TagNamespace::Custom: return "custom_tags";
    }
    return "";
}

std::string_view namespaceName(TagNamespace ns) {
    switch (ns) {
        case TagNamespace::Type: return "type-tag";
        case TagNamespace::Custom: return "custom-tag";
    }
    return "";
}

std::string_view schemeName(KeyScheme scheme) {
    switch (scheme) {
        case KeyScheme::Auto: return "auto";
        case KeyScheme::Qualified: return "qualified";
        case KeyScheme::Legacy: return "legacy";
    }
    return "";
}

std::optional<KeyScheme> parseScheme(std::string_view text) {
    if (text == "auto") return KeyScheme::Auto;
    if (text == "qualified") return KeyScheme::Qualified;
    if (text == "legacy") return KeyScheme::Legacy;
    return std::nullopt;
}

std::string normalizeTypeName(std::string_view name) {
    std::string out;
    out.reserve(name.size());

    bool pendingSpace = false;
    for (char c : name) {
        if (isSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        // Keep a single space only where it separates two words ("unsigned int")
        if (pendingSpace && isIdentChar(out.back()) && isIdentChar(c)) {
            out += ' ';
        }
        pendingSpace = false;
        out += c;
    }

    if (out.size() >= 2 && out[0] == ':' && out[1] == ':') {
        out.erase(0, 2);
    }
    return out;
}

std::string bareTypeName(std::string_view name) {
    std::string normalized = normalizeTypeName(name);

    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < normalized.size(); ++i) {
        char c = normalized[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0 && c == ':' && i + 1 < normalized.size() && normalized[i + 1] == ':') {
            start = i + 2;
            ++i;
        }
    }

    std::string bare = normalized.substr(start);
    auto angle = bare.find('<');
    if (angle != std::string::npos) {
        bare.erase(angle);
    }
    return bare;
}

std::string typeKey(std::string_view typeName, KeyScheme scheme) {
    switch (scheme) {
        case KeyScheme::Legacy:
            return "::" + bareTypeName(typeName);
        case KeyScheme::Qualified:
        case KeyScheme::Auto:
            break;
    }
    return normalizeTypeName(typeName);
}

void validateKey(TagNamespace ns, std::string_view key, const std::filesystem::path& storePath) {
    if (key.empty()) {
        throw InvalidKey("empty " + std::string(namespaceName(ns)) + " key", storePath);
    }
    for (char c : key) {
        if (isControl(c)) {
            throw InvalidKey(describe(ns, key) + " contains a control character",
                             storePath, std::string(key));
        }
    }
    if (isSpace(key.front()) || isSpace(key.back())) {
        throw InvalidKey(describe(ns, key) + " has leading or trailing whitespace",
                         storePath, std::string(key));
    }
}

void validateTypeName(std::string_view typeName, const std::filesystem::path& storePath) {
    for (char c : typeName) {
        if (isControl(c)) {
            throw InvalidKey("type name \"" + std::string(typeName) + "\" contains a control character",
                             storePath, std::string(typeName));
        }
    }

    std::string n = normalizeTypeName(typeName);
    if (n.empty()) {
        throw InvalidKey("empty type name", storePath, std::string(typeName));
    }

    auto fail = [&](const char* reason) {
        throw InvalidKey("type name \"" + std::string(typeName) + "\": " + reason,
                         storePath, std::string(typeName));
    };

    int depth = 0;
    size_t componentLength = 0;
    for (size_t i = 0; i < n.size(); ++i) {
        char c = n[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            if (--depth < 0) fail("unbalanced '>'");
        } else if (depth == 0 && c == ':') {
            if (i + 1 >= n.size() || n[i + 1] != ':') fail("stray ':'");
            if (componentLength == 0) fail("empty path component");
            componentLength = 0;
            ++i;
            continue;
        }
        ++componentLength;
    }

    if (depth != 0) fail("unbalanced '<'");
    if (componentLength == 0) fail("trailing '::'");
}

}  // namespace tagreg
