#include "tagreg/codegen.hpp"
#include "tagreg/registry.hpp"
#include "tagreg/store_format.hpp"
#include "tagreg/tag_key.hpp"
#include "tagreg/tag_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace tagreg {

namespace {

const std::unordered_set<std::string_view>& cppKeywords() {
    static const std::unordered_set<std::string_view> keywords = {
        "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool",
        "break", "case", "catch", "char", "char8_t", "char16_t", "char32_t", "class",
        "compl", "concept", "const", "consteval", "constexpr", "constinit", "const_cast",
        "continue", "co_await", "co_return", "co_yield", "decltype", "default", "delete",
        "do", "double", "dynamic_cast", "else", "enum", "explicit", "export", "extern",
        "false", "float", "for", "friend", "goto", "if", "inline", "int", "long", "mutable",
        "namespace", "new", "noexcept", "not", "not_eq", "nullptr", "operator", "or",
        "or_eq", "private", "protected", "public", "register", "reinterpret_cast",
        "requires", "return", "short", "signed", "sizeof", "static", "static_assert",
        "static_cast", "struct", "switch", "template", "this", "thread_local", "throw",
        "true", "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
        "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq"};
    return keywords;
}

bool isIdentifier(std::string_view s) {
    if (s.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(s.front()))) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return cppKeywords().count(s) == 0;
}

void checkNamespace(std::string_view ns) {
    std::string_view rest = ns;
    while (true) {
        auto sep = rest.find("::");
        if (!isIdentifier(rest.substr(0, sep))) {
            throw std::invalid_argument("invalid namespace '" + std::string(ns) + "'");
        }
        if (sep == std::string_view::npos) break;
        rest.remove_prefix(sep + 2);
    }
}

// Type as written inside TypeTag<...>. Paths get a leading "::" so they
// resolve from the global namespace; "unsigned int" or "const geo::Point"
// start with a keyword and can't take one.
std::string typeArgument(const std::string& type) {
    size_t end = 0;
    while (end < type.size() &&
           (std::isalnum(static_cast<unsigned char>(type[end])) || type[end] == '_')) {
        ++end;
    }
    if (cppKeywords().count(std::string_view(type).substr(0, end)) != 0) {
        return type;
    }
    return "::" + type;
}

}  // anonymous namespace

std::string uuidInitializer(const Uuid& id) {
    static constexpr char DIGITS[] = "0123456789abcdef";

    std::string out = "tagreg::Uuid::Bytes{";
    const auto& bytes = id.bytes();
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) out += ", ";
        out += "0x";
        out += DIGITS[bytes[i] >> 4];
        out += DIGITS[bytes[i] & 0x0F];
    }
    out += '}';
    return out;
}

std::string HeaderGenerator::constantName(std::string_view tag) {
    std::string name;
    name.reserve(tag.size());
    for (char c : tag) {
        name += (std::isalnum(static_cast<unsigned char>(c)) || c == '_') ? c : '_';
    }
    if (!name.empty() && std::isdigit(static_cast<unsigned char>(name.front()))) {
        name.insert(0, "tag_");
    }
    return name;
}

void HeaderGenerator::addType(std::string typeName) {
    validateTypeName(typeName);
    std::string normalized = normalizeTypeName(typeName);
    if (std::find(types_.begin(), types_.end(), normalized) == types_.end()) {
        types_.push_back(std::move(normalized));
    }
}

void HeaderGenerator::addTag(std::string_view spec) {
    TagRequest request;
    auto eq = spec.find('=');
    if (eq != std::string_view::npos && isIdentifier(spec.substr(0, eq))) {
        request.name = std::string(spec.substr(0, eq));
        request.tag = std::string(spec.substr(eq + 1));
    } else {
        request.tag = std::string(spec);
        request.name = constantName(spec);
    }

    validateKey(TagNamespace::Custom, request.tag);
    if (!isIdentifier(request.name)) {
        throw std::invalid_argument("tag \"" + request.tag + "\" gives constant name '" +
                                    request.name + "'; use NAME=" + request.tag);
    }
    for (const auto& existing : tags_) {
        if (existing.name == request.name) {
            if (existing.tag == request.tag) return;
            throw std::invalid_argument("constant '" + request.name + "' requested for both \"" +
                                        existing.tag + "\" and \"" + request.tag + "\"");
        }
    }
    tags_.push_back(std::move(request));
}

std::string HeaderGenerator::render(Registry& registry) const {
    checkNamespace(namespace_);

    std::ostringstream out;
    out << "// Generated by tagreg from " << registry.store().path().filename().string()
        << ". Do not edit.\n"
        << "#pragma once\n\n"
        << "#include <tagreg/unique_tag.hpp>\n";
    for (const auto& include : includes_) {
        out << "#include \"" << include << "\"\n";
    }

    if (!types_.empty()) {
        out << "\nnamespace tagreg {\n";
        for (const auto& type : types_) {
            Uuid id = registry.resolveType(type);
            out << "\n// " << type << ": " << id.toString() << "\n"
                << "template<>\n"
                << "struct TypeTag<" << typeArgument(type) << "> {\n"
                << "    static constexpr Uuid value{" << uuidInitializer(id) << "};\n"
                << "};\n";
        }
        out << "\n}  // namespace tagreg\n";
    }

    if (!tags_.empty()) {
        out << "\nnamespace " << namespace_ << " {\n\n";
        for (const auto& request : tags_) {
            Uuid id = registry.resolveTag(request.tag);
            out << "// " << quoteKey(request.tag) << ": " << id.toString() << "\n"
                << "inline constexpr tagreg::Uuid " << request.name << "{"
                << uuidInitializer(id) << "};\n";
        }
        out << "\n}  // namespace " << namespace_ << "\n";
    }

    return out.str();
}

bool HeaderGenerator::writeTo(const std::filesystem::path& path, Registry& registry) const {
    std::string content = render(registry);

    std::ifstream existing(path, std::ios::binary);
    if (existing.is_open()) {
        std::stringstream buffer;
        buffer << existing.rdbuf();
        if (buffer.str() == content) {
            return false;
        }
    }

    writeFileAtomically(path, content);
    return true;
}

}  // namespace tagreg
