#pragma once

#include <cstdint>
#include <string>

/**
 * ZX Spectrum Character Set
 *
 * Maps between ZX Spectrum character bytes and source text. The printable
 * ASCII range is shared with three exceptions: 0x5E is an up-arrow, 0x60 is
 * the pound sign and 0x7F is the copyright sign. 0x80-0x8F are the 2x2
 * block graphics and 0x90-0xA2 are the user-defined graphics A-U.
 *
 * Source text may spell the special characters as UTF-8 or with the escape
 * sequences {(C)} and {UDG:nn}.
 */

namespace zxbasic {
namespace ZXCharset {

constexpr uint8_t UP_ARROW = 0x5E;
constexpr uint8_t POUND = 0x60;
constexpr uint8_t COPYRIGHT = 0x7F;
constexpr uint8_t FIRST_BLOCK_GRAPHIC = 0x80;
constexpr uint8_t LAST_BLOCK_GRAPHIC = 0x8F;
constexpr uint8_t FIRST_UDG = 0x90;
constexpr uint8_t LAST_UDG = 0xA2;
constexpr uint8_t REPLACEMENT_CHAR = '?';

bool isBlockGraphic(uint8_t byte);
bool isUdg(uint8_t byte);

/**
 * Render one ZX character byte as text
 * @param byte Character byte (tokens and control codes render as '?')
 * @param unicode Render 0x5E, 0x60 and 0x7F as UTF-8 symbols
 */
std::string byteToText(uint8_t byte, bool unicode);

/**
 * Decode one special character from source text
 * Recognizes the UTF-8 symbols and the {(C)} / {UDG:nn} escapes.
 * @param text Source text
 * @param pos Position to decode at
 * @param out Receives the ZX byte
 * @return Number of source bytes consumed, 0 if nothing matched
 */
size_t textToByte(const std::string& text, size_t pos, uint8_t& out);

} // namespace ZXCharset
} // namespace zxbasic
