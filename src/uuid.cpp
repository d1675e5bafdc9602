#include "tagreg/uuid.hpp"

#include <random>

namespace tagreg {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isHyphenPosition(size_t pos) {
    return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

}  // anonymous namespace

Uuid Uuid::generateV4() {
    // Draw straight from the OS entropy source, no seeded engine
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dist;

    Bytes bytes{};
    for (size_t i = 0; i < bytes.size(); i += 4) {
        uint32_t word = dist(rd);
        bytes[i] = static_cast<uint8_t>(word >> 24);
        bytes[i + 1] = static_cast<uint8_t>(word >> 16);
        bytes[i + 2] = static_cast<uint8_t>(word >> 8);
        bytes[i + 3] = static_cast<uint8_t>(word);
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != STRING_LENGTH) {
        return std::nullopt;
    }

    Bytes bytes{};
    size_t byteIndex = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (isHyphenPosition(pos)) {
            if (text[pos] != '-') return std::nullopt;
            ++pos;
            continue;
        }
        int hi = hexValue(text[pos]);
        int lo = hexValue(text[pos + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes[byteIndex++] = static_cast<uint8_t>((hi << 4) | lo);
        pos += 2;
    }
    return Uuid(bytes);
}

std::string Uuid::toString() const {
    static constexpr char DIGITS[] = "0123456789abcdef";

    std::string out;
    out.reserve(STRING_LENGTH);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += DIGITS[bytes_[i] >> 4];
        out += DIGITS[bytes_[i] & 0x0F];
    }
    return out;
}

}  // namespace tagreg
