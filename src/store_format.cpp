#include "tagreg/store_format.hpp"
#include "tagreg/registry_error.hpp"

#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <sstream>

namespace tagreg {

namespace {

constexpr std::string_view KEY_SCHEME_FIELD = "key_scheme";

bool isBareKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Table name -> namespace, including the legacy aliases
std::optional<TagNamespace> tableNamespace(std::string_view name) {
    if (name == "custom_tags" || name == "unique_tags") return TagNamespace::Custom;
    if (name == "type_tags" || name == "unique_type_tags") return TagNamespace::Type;
    return std::nullopt;
}

// ============================================================================
// LineReader - cursor over one line of store text
// ============================================================================

class LineReader {
public:
    LineReader(std::string_view line, const std::filesystem::path& source, int lineNum)
        : line_(line), source_(source), lineNum_(lineNum) {}

    [[noreturn]] void fail(const std::string& reason) const {
        std::ostringstream msg;
        msg << (source_.empty() ? std::string("<store>") : source_.string())
            << ":" << lineNum_ << ": " << reason;
        throw StoreCorrupt(msg.str(), source_);
    }

    void skipSpace() {
        while (pos_ < line_.size() && (line_[pos_] == ' ' || line_[pos_] == '\t')) {
            ++pos_;
        }
    }

    [[nodiscard]] bool atEnd() const { return pos_ >= line_.size(); }
    [[nodiscard]] char peek() const { return atEnd() ? '\0' : line_[pos_]; }

    void expect(char c, const char* what) {
        if (peek() != c) {
            fail(std::string("expected ") + what);
        }
        ++pos_;
    }

    // Only whitespace and an optional comment may follow
    void expectEndOfLine() {
        skipSpace();
        if (!atEnd() && peek() != '#') {
            fail("unexpected trailing content '" + std::string(line_.substr(pos_)) + "'");
        }
    }

    std::string parseKey() {
        char c = peek();
        if (c == '"') return parseBasicString();
        if (c == '\'') return parseLiteralString();

        size_t start = pos_;
        while (!atEnd() && isBareKeyChar(peek())) {
            ++pos_;
        }
        if (pos_ == start) {
            fail("expected a key");
        }
        return std::string(line_.substr(start, pos_ - start));
    }

    std::string parseStringValue() {
        char c = peek();
        if (c == '"') return parseBasicString();
        if (c == '\'') return parseLiteralString();
        if (atEnd()) fail("missing value");
        fail("value must be a string");
    }

private:
    std::string parseBasicString() {
        ++pos_;  // opening quote
        std::string out;
        while (true) {
            if (atEnd()) fail("unterminated string");
            char c = line_[pos_++];
            if (c == '"') break;
            if (c != '\\') {
                if (static_cast<unsigned char>(c) < 0x20 && c != '\t') {
                    fail("control character in string");
                }
                out += c;
                continue;
            }
            if (atEnd()) fail("unterminated escape");
            char e = line_[pos_++];
            switch (e) {
                case 'b': out += '\b'; break;
                case 't': out += '\t'; break;
                case 'n': out += '\n'; break;
                case 'f': out += '\f'; break;
                case 'r': out += '\r'; break;
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case 'u': appendUtf8(out, parseCodepoint(4)); break;
                case 'U': appendUtf8(out, parseCodepoint(8)); break;
                default:
                    fail(std::string("invalid escape '\\") + e + "'");
            }
        }
        return out;
    }

    std::string parseLiteralString() {
        ++pos_;
        auto close = line_.find('\'', pos_);
        if (close == std::string_view::npos) {
            fail("unterminated literal string");
        }
        std::string out(line_.substr(pos_, close - pos_));
        pos_ = close + 1;
        return out;
    }

    uint32_t parseCodepoint(int digits) {
        uint32_t cp = 0;
        for (int i = 0; i < digits; ++i) {
            int v = atEnd() ? -1 : hexValue(line_[pos_]);
            if (v < 0) fail("invalid unicode escape");
            cp = (cp << 4) | static_cast<uint32_t>(v);
            ++pos_;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            fail("unicode escape is not a scalar value");
        }
        return cp;
    }

    std::string_view line_;
    size_t pos_ = 0;
    const std::filesystem::path& source_;
    int lineNum_;
};

}  // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

RegistryState parseStore(std::string_view content, const std::filesystem::path& source) {
    RegistryState state;

    // UTF-8 byte order mark
    if (content.size() >= 3 && content.substr(0, 3) == "\xEF\xBB\xBF") {
        content.remove_prefix(3);
    }

    std::optional<TagNamespace> current;
    bool seenTable[2] = {false, false};
    bool seenScheme = false;

    std::string_view remaining = content;
    int lineNum = 0;

    while (!remaining.empty()) {
        ++lineNum;
        auto lineEnd = remaining.find('\n');
        std::string_view line = remaining.substr(0, lineEnd);
        remaining = (lineEnd == std::string_view::npos) ? std::string_view{}
                                                         : remaining.substr(lineEnd + 1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        LineReader reader(line, source, lineNum);
        reader.skipSpace();
        if (reader.atEnd() || reader.peek() == '#') {
            continue;
        }

        if (reader.peek() == '[') {
            reader.expect('[', "'['");
            if (reader.peek() == '[') {
                reader.fail("arrays of tables are not allowed in a tag store");
            }
            reader.skipSpace();
            std::string name = reader.parseKey();
            reader.skipSpace();
            if (reader.peek() == '.') {
                reader.fail("unexpected table '" + name + ".'");
            }
            reader.expect(']', "']'");
            reader.expectEndOfLine();

            auto ns = tableNamespace(name);
            if (!ns) {
                reader.fail("unexpected table '" + name + "'");
            }
            auto index = static_cast<size_t>(*ns);
            if (seenTable[index]) {
                reader.fail("table '" + std::string(tableName(*ns)) + "' defined twice");
            }
            seenTable[index] = true;
            current = ns;
            continue;
        }

        std::string key = reader.parseKey();
        reader.skipSpace();
        if (reader.peek() == '.') {
            reader.fail("dotted keys are not allowed in a tag store");
        }
        reader.expect('=', "'=' after key");
        reader.skipSpace();
        std::string value = reader.parseStringValue();
        reader.expectEndOfLine();

        if (!current) {
            if (key != KEY_SCHEME_FIELD) {
                reader.fail("unexpected top-level key '" + key + "'");
            }
            if (seenScheme) {
                reader.fail("duplicate key '" + key + "'");
            }
            auto scheme = parseScheme(value);
            if (!scheme || *scheme == KeyScheme::Auto) {
                reader.fail("invalid key_scheme '" + value + "'");
            }
            state.setKeyScheme(scheme);
            seenScheme = true;
            continue;
        }

        auto id = Uuid::parse(value);
        if (!id) {
            reader.fail("invalid identifier '" + value + "' for key '" + key + "'");
        }
        if (!state.insert(*current, key, *id)) {
            reader.fail("duplicate key '" + key + "' in table '" +
                        std::string(tableName(*current)) + "'");
        }
    }

    return state;
}

// ============================================================================
// Formatting
// ============================================================================

std::string quoteKey(std::string_view key) {
    static constexpr char DIGITS[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(key.size() + 2);
    out += '"';
    for (char c : key) {
        auto u = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default:
                if (u < 0x20 || u == 0x7F) {
                    out += "\\u00";
                    out += DIGITS[u >> 4];
                    out += DIGITS[u & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string formatStore(const RegistryState& state) {
    std::ostringstream out;
    out << "# Tag identifier store. Entries are append-only: an identifier, once\n"
        << "# assigned, must never change or be reused.\n";

    if (auto scheme = state.keyScheme()) {
        out << "\n" << KEY_SCHEME_FIELD << " = \"" << schemeName(*scheme) << "\"\n";
    }

    for (auto ns : {TagNamespace::Custom, TagNamespace::Type}) {
        out << "\n[" << tableName(ns) << "]\n";
        for (const auto& [key, id] : state.table(ns)) {
            out << quoteKey(key) << " = \"" << id.toString() << "\"\n";
        }
    }

    return out.str();
}

}  // namespace tagreg
