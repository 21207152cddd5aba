#include "ZXCharset.hpp"
#include <cctype>
#include <cstdio>
#include <cstring>

namespace zxbasic {
namespace ZXCharset {

namespace {

struct SpecialChar {
    uint8_t byte;
    const char* utf8;
};

// Quadrant bits: 1 = top right, 2 = top left, 4 = bottom right, 8 = bottom left.
// 0x80 has no ink at all and maps to NO-BREAK SPACE so it survives a
// round trip through text.
const SpecialChar BLOCK_GRAPHICS[] = {
    {0x80, "\xC2\xA0"},      // U+00A0
    {0x81, "\xE2\x96\x9D"},  // U+259D QUADRANT UPPER RIGHT
    {0x82, "\xE2\x96\x98"},  // U+2598 QUADRANT UPPER LEFT
    {0x83, "\xE2\x96\x80"},  // U+2580 UPPER HALF BLOCK
    {0x84, "\xE2\x96\x97"},  // U+2597 QUADRANT LOWER RIGHT
    {0x85, "\xE2\x96\x90"},  // U+2590 RIGHT HALF BLOCK
    {0x86, "\xE2\x96\x9A"},  // U+259A QUADRANT UPPER LEFT AND LOWER RIGHT
    {0x87, "\xE2\x96\x9C"},  // U+259C
    {0x88, "\xE2\x96\x96"},  // U+2596 QUADRANT LOWER LEFT
    {0x89, "\xE2\x96\x9E"},  // U+259E QUADRANT UPPER RIGHT AND LOWER LEFT
    {0x8A, "\xE2\x96\x8C"},  // U+258C LEFT HALF BLOCK
    {0x8B, "\xE2\x96\x9B"},  // U+259B
    {0x8C, "\xE2\x96\x84"},  // U+2584 LOWER HALF BLOCK
    {0x8D, "\xE2\x96\x9F"},  // U+259F
    {0x8E, "\xE2\x96\x99"},  // U+2599
    {0x8F, "\xE2\x96\x88"},  // U+2588 FULL BLOCK
};

const SpecialChar SYMBOLS[] = {
    {UP_ARROW, "\xE2\x86\x91"},  // U+2191
    {POUND, "\xC2\xA3"},         // U+00A3
    {COPYRIGHT, "\xC2\xA9"},     // U+00A9
};

const char* COPYRIGHT_ESCAPE = "{(C)}";
const char* UDG_ESCAPE = "{UDG:";

bool startsWithAt(const std::string& text, size_t pos, const char* prefix) {
    size_t len = std::strlen(prefix);
    return text.compare(pos, len, prefix) == 0;
}

} // namespace

bool isBlockGraphic(uint8_t byte) {
    return byte >= FIRST_BLOCK_GRAPHIC && byte <= LAST_BLOCK_GRAPHIC;
}

bool isUdg(uint8_t byte) {
    return byte >= FIRST_UDG && byte <= LAST_UDG;
}

std::string byteToText(uint8_t byte, bool unicode) {
    if (unicode) {
        for (const auto& symbol : SYMBOLS) {
            if (symbol.byte == byte) return symbol.utf8;
        }
    }

    if (byte >= 0x20 && byte <= 0x7E) {
        return std::string(1, static_cast<char>(byte));
    }
    if (byte == COPYRIGHT) {
        return COPYRIGHT_ESCAPE;
    }
    if (isBlockGraphic(byte)) {
        return BLOCK_GRAPHICS[byte - FIRST_BLOCK_GRAPHIC].utf8;
    }
    if (isUdg(byte)) {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "{UDG:%02d}", byte - FIRST_UDG);
        return buffer;
    }
    return std::string(1, static_cast<char>(REPLACEMENT_CHAR));
}

size_t textToByte(const std::string& text, size_t pos, uint8_t& out) {
    if (pos >= text.size()) return 0;

    if (text[pos] == '{') {
        if (startsWithAt(text, pos, COPYRIGHT_ESCAPE)) {
            out = COPYRIGHT;
            return std::strlen(COPYRIGHT_ESCAPE);
        }
        if (startsWithAt(text, pos, UDG_ESCAPE)) {
            size_t digitsAt = pos + std::strlen(UDG_ESCAPE);
            if (digitsAt + 2 < text.size() &&
                std::isdigit(static_cast<unsigned char>(text[digitsAt])) &&
                std::isdigit(static_cast<unsigned char>(text[digitsAt + 1])) &&
                text[digitsAt + 2] == '}') {
                int index = (text[digitsAt] - '0') * 10 + (text[digitsAt + 1] - '0');
                if (index <= LAST_UDG - FIRST_UDG) {
                    out = static_cast<uint8_t>(FIRST_UDG + index);
                    return std::strlen(UDG_ESCAPE) + 3;
                }
            }
        }
        return 0;
    }

    if (static_cast<unsigned char>(text[pos]) < 0x80) return 0;

    for (const auto& symbol : SYMBOLS) {
        if (startsWithAt(text, pos, symbol.utf8)) {
            out = symbol.byte;
            return std::strlen(symbol.utf8);
        }
    }
    for (const auto& block : BLOCK_GRAPHICS) {
        if (startsWithAt(text, pos, block.utf8)) {
            out = block.byte;
            return std::strlen(block.utf8);
        }
    }
    return 0;
}

} // namespace ZXCharset
} // namespace zxbasic
